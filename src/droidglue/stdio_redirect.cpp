/**
 * @file stdio_redirect.cpp
 * @brief Line-buffered stdio redirection.
 *
 * @copyright GPL-2.0-or-later
 */

#include "droidglue/stdio_redirect.h"

#include <cstdio>
#include <iostream>
#include <mutex>
#include <utility>

namespace droidglue {

// ─────────────────────────────────────────────────────────────────────────────
// LogStreamBuf
// ─────────────────────────────────────────────────────────────────────────────

LogStreamBuf::LogStreamBuf(LineSink sink)
    : sink_(std::move(sink)) {
    line_.reserve(MaxLineLength);
}

LogStreamBuf::~LogStreamBuf() {
    flush_partial();
}

void LogStreamBuf::flush_partial() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!line_.empty()) {
        emit_locked();
    }
}

LogStreamBuf::int_type LogStreamBuf::overflow(int_type ch) {
    if (traits_type::eq_int_type(ch, traits_type::eof())) {
        return traits_type::not_eof(ch);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    put_locked(traits_type::to_char_type(ch));
    return ch;
}

std::streamsize LogStreamBuf::xsputn(const char* s, std::streamsize count) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::streamsize i = 0; i < count; ++i) {
        put_locked(s[i]);
    }
    return count;
}

LineSink LogStreamBuf::replace_sink(LineSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!line_.empty()) {
        emit_locked();
    }
    std::swap(sink_, sink);
    return sink;
}

int LogStreamBuf::sync() {
    // Partial lines stay buffered; std::cerr flushes after every insertion
    return 0;
}

void LogStreamBuf::put_locked(char ch) {
    if (ch == '\n') {
        emit_locked();
        return;
    }
    line_.push_back(ch);
    if (line_.size() >= MaxLineLength) {
        emit_locked();
    }
}

void LogStreamBuf::emit_locked() {
    if (sink_) {
        sink_(line_);
    }
    line_.clear();
}

// ─────────────────────────────────────────────────────────────────────────────
// StdioRedirect
// ─────────────────────────────────────────────────────────────────────────────

namespace {

void write_to_stderr(std::string_view line) {
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fputc('\n', stderr);
}

} // anonymous namespace

LogStreamBuf& StdioRedirect::buffer() {
    // Never destroyed: std::cout may still flush into it during exit
    static LogStreamBuf* const instance = new LogStreamBuf(&write_to_stderr);
    return *instance;
}

StdioRedirect::StdioRedirect(LineSink sink) {
    static std::once_flag attached;
    std::call_once(attached, [] {
        std::cout.rdbuf(&buffer());
        std::cerr.rdbuf(&buffer());
    });
    previous_ = buffer().replace_sink(std::move(sink));
}

StdioRedirect::~StdioRedirect() {
    buffer().replace_sink(std::move(previous_));
}

} // namespace droidglue
