#pragma once

#include <QString>

namespace crcc {

// "10MB" -> 10485760. Units B, K/KB, M/MB, G/GB, T/TB (and the KiB..TiB
// spellings) are case-insensitive powers of 1024; anything else is bytes.
quint64 parseSize(const QString& text);

// Unix seconds (UTC) for the first matching engine/CLI timestamp format.
// Unparsable input yields the current time and sets *ok to false.
qint64 parseTimestamp(const QString& text, bool* ok = nullptr);

}  // namespace crcc
