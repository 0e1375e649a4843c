// Copyright (c) Huawei Technologies Co., Ltd. 2025. All rights reserved.
// This source file is part of the Cangjie project, licensed under Apache-2.0
// with Runtime Library Exception.
//
// See https://cangjie-lang.cn/pages/LICENSE for license information.

/**
 * @file
 *
 * This file declares Print related apis.
 */

#ifndef METALITH_BASIC_PRINT_H
#define METALITH_BASIC_PRINT_H

#include <iomanip>
#include <iostream>
#include <string>
#include <utility>

namespace Metalith {
const std::string ANSI_COLOR_RED = "\x1b[31m";
const std::string ANSI_COLOR_YELLOW = "\x1b[33m";
const std::string ANSI_COLOR_RESET = "\x1b[0m";

const std::string RED_ERROR_MARK = ANSI_COLOR_RED + "error" + ANSI_COLOR_RESET + ": ";
const std::string YELLOW_WARNING_MARK = ANSI_COLOR_YELLOW + "warning" + ANSI_COLOR_RESET + ": ";

///@{
/// Plain console output used by the encoder for statistics and internal errors. Errors and warnings go to
/// stderr, statistics to stdout.
template <typename Arg> inline void Println(Arg&& arg)
{
    std::cout << std::forward<Arg>(arg) << std::endl;
}

// Right-aligned label followed by a value, used for the statistics table.
template <typename Value> inline void PrintLabeled(const std::string& label, const Value& value, int labelWidth)
{
    std::cout << std::right << std::setfill(' ') << std::setw(labelWidth) << label << ": " << value << std::endl;
}

// no format Error print with new line
template <typename... Args> inline void Errorln(Args&&... args) noexcept
{
    std::cerr << RED_ERROR_MARK;
    ((std::cerr << args), ...);
    std::cerr << std::endl;
}

template <typename... Args> inline void Warningln(Args&&... args)
{
    std::cerr << YELLOW_WARNING_MARK;
    ((std::cerr << args), ...);
    std::cerr << std::endl;
}
///@}
} // namespace Metalith

#endif
