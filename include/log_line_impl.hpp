/**
 * @file log_line_impl.hpp
 * @brief Implementation of log_line emission
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include "log_line.hpp"
#include "log_dispatcher.hpp"

namespace tagsink
{

inline log_line &log_line::flush()
{
    if (logger_)
    {
        logger_->emit(text(), tags_, site_);
        text_.clear();
        flushed_ = true;
    }
    return *this;
}

inline log_line::~log_line()
{
    if (!logger_ || (flushed_ && text_.size() == 0)) return;

    logger_->emit(text(), tags_, site_);
}

} // namespace tagsink
