// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares the DiagnosticEngine, the sink through which the metadata encoder reports internal
 * invariant violations. Fatal reports abort the encode by throwing InternalCompilerError.
 */

#ifndef METALITH_BASIC_DIAGNOSTICENGINE_H
#define METALITH_BASIC_DIAGNOSTICENGINE_H

#include <cstdint>
#include <exception>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace Metalith {
enum class DiagKind : uint16_t {
#define DIAG(KIND, FORMAT) KIND,
#include "metalith/Basic/DiagKind.def"
#undef DIAG
};

class InternalCompilerError : public std::exception {
public:
    InternalCompilerError(DiagKind kind, std::string message) : kind(kind), message(std::move(message))
    {
    }

    const char* what() const noexcept override
    {
        return message.c_str();
    }

    DiagKind GetKind() const
    {
        return kind;
    }

private:
    DiagKind kind;
    std::string message;
};

struct Diagnostic {
    DiagKind kind;
    bool isFatal;
    std::string message;
};

class DiagnosticEngine {
public:
    /**
     * Report an internal invariant violation. The message is logged and recorded, then the current encode is
     * aborted.
     */
    template <typename... Args> [[noreturn]] void Fatal(DiagKind kind, const Args&... args)
    {
        EmitFatal(kind, {ToText(args)...});
    }

    template <typename... Args> void Warn(DiagKind kind, const Args&... args)
    {
        EmitWarning(kind, {ToText(args)...});
    }

    uint64_t GetErrorCount() const
    {
        return errorCount;
    }

    uint64_t GetWarningCount() const
    {
        return warningCount;
    }

    const std::vector<Diagnostic>& GetDiagnostics() const
    {
        return diagnostics;
    }

    static std::string FormatMessage(DiagKind kind, const std::vector<std::string>& args);

private:
    template <typename T> static std::string ToText(const T& value)
    {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }

    [[noreturn]] void EmitFatal(DiagKind kind, const std::vector<std::string>& args);
    void EmitWarning(DiagKind kind, const std::vector<std::string>& args);

    uint64_t errorCount{0};
    uint64_t warningCount{0};
    std::vector<Diagnostic> diagnostics;
};
} // namespace Metalith

#endif
