#include "core/metaschema.hpp"

#include "core/logging.hpp"

#include <QHash>
#include <QMutex>
#include <QMutexLocker>
#include <QRegularExpression>
#include <QString>

namespace oscal {
namespace {

// Compiled patterns keyed by datatype name. The set of patterns is closed,
// so the cache never needs eviction.
struct PatternCache {
    QMutex mu;
    QHash<QString, QRegularExpression> compiled;
};

PatternCache& cache() {
    static PatternCache c{};
    return c;
}

QRegularExpression compiled_pattern(const DatatypeInfo& info) {
    auto& c = cache();
    const auto key = QString::fromUtf8(info.name.data(), static_cast<qsizetype>(info.name.size()));

    QMutexLocker lock(&c.mu);
    const auto it = c.compiled.constFind(key);
    if (it != c.compiled.constEnd()) {
        return it.value();
    }

    const auto source = QString::fromUtf8(info.pattern.data(), static_cast<qsizetype>(info.pattern.size()));
    QRegularExpression re(QRegularExpression::anchoredPattern(source));
    if (!re.isValid()) {
        qCWarning(oscalTypesLog) << "invalid pattern for" << key << ":" << re.errorString();
    }
    re.optimize();
    c.compiled.insert(key, re);
    return re;
}

} // namespace

bool matches_pattern(const DatatypeInfo& info, std::string_view text) {
    if (info.pattern.empty()) {
        return true;
    }
    const auto re = compiled_pattern(info);
    if (!re.isValid()) {
        return false;
    }
    const auto subject = QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
    return re.match(subject).hasMatch();
}

} // namespace oscal
