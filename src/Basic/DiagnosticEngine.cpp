// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file implements the DiagnosticEngine.
 */

#include "metalith/Basic/DiagnosticEngine.h"

#include "metalith/Basic/Print.h"

using namespace Metalith;

namespace {
const char* const DIAG_FORMATS[] = {
#define DIAG(KIND, FORMAT) FORMAT,
#include "metalith/Basic/DiagKind.def"
#undef DIAG
};
} // namespace

std::string DiagnosticEngine::FormatMessage(DiagKind kind, const std::vector<std::string>& args)
{
    std::string format = DIAG_FORMATS[static_cast<size_t>(kind)];
    std::string result;
    size_t argIndex = 0;
    for (size_t i = 0; i < format.size(); ++i) {
        if (format[i] == '%' && i + 1 < format.size() && format[i + 1] == 's') {
            result += argIndex < args.size() ? args[argIndex] : std::string("<?>");
            ++argIndex;
            ++i;
            continue;
        }
        result += format[i];
    }
    return result;
}

void DiagnosticEngine::EmitFatal(DiagKind kind, const std::vector<std::string>& args)
{
    auto message = FormatMessage(kind, args);
    ++errorCount;
    diagnostics.push_back({kind, true, message});
    Errorln("internal error while encoding metadata: ", message);
    throw InternalCompilerError(kind, message);
}

void DiagnosticEngine::EmitWarning(DiagKind kind, const std::vector<std::string>& args)
{
    auto message = FormatMessage(kind, args);
    ++warningCount;
    diagnostics.push_back({kind, false, message});
    Warningln(message);
}
