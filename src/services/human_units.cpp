#include "crcc/human_units.hpp"

#include <QDateTime>
#include <QLocale>
#include <QRegularExpression>
#include <QStringList>
#include <QTimeZone>

#include <cmath>

#include "crcc/telemetry.hpp"

namespace crcc {

namespace {

int unitExponent(const QString& unit) {
    const QString upper = unit.toUpper();
    if (upper == "K" || upper == "KB" || upper == "KIB") {
        return 1;
    }
    if (upper == "M" || upper == "MB" || upper == "MIB") {
        return 2;
    }
    if (upper == "G" || upper == "GB" || upper == "GIB") {
        return 3;
    }
    if (upper == "T" || upper == "TB" || upper == "TIB") {
        return 4;
    }
    return 0;
}

qint64 offsetSeconds(const QString& offset) {
    if (offset.isEmpty() || offset == "Z") {
        return 0;
    }
    QString digits = offset.mid(1);
    digits.remove(':');
    const qint64 hours = digits.left(2).toLongLong();
    const qint64 minutes = digits.mid(2, 2).toLongLong();
    const qint64 seconds = hours * 3600 + minutes * 60;
    return offset.startsWith('-') ? -seconds : seconds;
}

}  // namespace

quint64 parseSize(const QString& text) {
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return 0;
    }

    QString numeric;
    QString unit;
    bool negative = false;
    for (int i = 0; i < trimmed.size(); ++i) {
        const QChar c = trimmed.at(i);
        if (i == 0 && (c == '+' || c == '-')) {
            negative = c == '-';
        } else if (c.isDigit() || c == '.') {
            numeric.append(c);
        } else if (!c.isSpace()) {
            unit.append(c);
        }
    }

    bool ok = false;
    const double value = numeric.toDouble(&ok);
    if (!ok || negative || value <= 0.0) {
        return 0;
    }
    const double bytes = value * std::pow(1024.0, unitExponent(unit));
    return static_cast<quint64>(std::llround(bytes));
}

qint64 parseTimestamp(const QString& text, bool* ok) {
    // Go renders "-0700 MST"; the trailing zone name may itself be numeric ("+0400 +04").
    static const QRegularExpression zoneSuffix(R"(\s+([A-Za-z]{2,5}|[+-]\d{2}(?::?\d{2})?)$)");
    static const QRegularExpression offsetSuffix(R"((?:\s*(Z|[+-]\d{2}:?\d{2})|\s+([+-]\d{2}))$)");
    static const QRegularExpression fraction(R"((\d{2}:\d{2}:\d{2})\.\d+)");
    static const QStringList formats = {
        "yyyy-MM-dd HH:mm:ss",
        "yyyy-MM-dd'T'HH:mm:ss",
        "ddd MMM d HH:mm:ss yyyy",
    };

    QString value = text.simplified();
    const QRegularExpressionMatch zoneMatch = zoneSuffix.match(value);
    if (zoneMatch.hasMatch()) {
        const QString rest = value.left(zoneMatch.capturedStart(0));
        // A numeric token is only a zone name when an offset precedes it.
        if (zoneMatch.captured(1).at(0).isLetter() || offsetSuffix.match(rest).hasMatch()) {
            value = rest;
        }
    }
    qint64 offset = 0;
    const QRegularExpressionMatch offsetMatch = offsetSuffix.match(value);
    if (offsetMatch.hasMatch()) {
        const QString token = offsetMatch.captured(1).isEmpty() ? offsetMatch.captured(2) : offsetMatch.captured(1);
        offset = offsetSeconds(token);
        value = value.left(offsetMatch.capturedStart(0));
    }
    value.replace(fraction, "\\1");
    value = value.trimmed();

    const QLocale c = QLocale::c();
    for (const QString& format : formats) {
        QDateTime parsed = c.toDateTime(value, format);
        if (!parsed.isValid()) {
            continue;
        }
        parsed.setTimeZone(QTimeZone::utc());
        if (ok != nullptr) {
            *ok = true;
        }
        return parsed.toSecsSinceEpoch() - offset;
    }

    if (ok != nullptr) {
        *ok = false;
    }
    Telemetry::instance().incrementCounter("normalizer.timestamp_fallbacks");
    Telemetry::instance().recordEvent("timestamp_fallback", {{"input", text.left(120)}});
    return QDateTime::currentSecsSinceEpoch();
}

}  // namespace crcc
