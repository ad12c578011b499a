#pragma once

#include <QString>

#include "core/result.hpp"

namespace tuid::cli {

struct GenerateOptions {
    int scheme = 4;
    QString ns;       // "dns", "url", "oid", "x500" or a UUID (v3, v5)
    QString name;     // v3, v5
    QString node;     // 12 hex digits, ':' or '-' separators allowed (v1, v6)
    QString payload;  // 32 hex digits or any UUID form (v8)
};

using CommandResult = Result<QString, QString>;

[[nodiscard]] CommandResult generate(const GenerateOptions& options);

[[nodiscard]] CommandResult inspect(const QString& text);

// Runs the validating conversion for `scheme` against `text`.
[[nodiscard]] CommandResult check(const QString& text, int scheme);

[[nodiscard]] QString features();

} // namespace tuid::cli
