/**
 * @file stdio_redirect.h
 * @brief Route std::cout and std::cerr to a line sink.
 *
 * On Android a process' stdout and stderr are discarded. While the bridge
 * runs, the C++ streams std::cout and std::cerr forward each completed
 * line to the platform log. The C stdio streams (printf, fputs and raw
 * writes to fd 1 and 2) are not captured; doing so would need a pipe and
 * a reader thread.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <ostream>
#include <streambuf>
#include <string>
#include <string_view>

namespace droidglue {

/// Receives one line of output, without the trailing newline
using LineSink = std::function<void(std::string_view)>;

/**
 * @brief Line-buffered stream buffer that emits complete lines.
 *
 * Lines longer than MaxLineLength are emitted in pieces. A trailing partial
 * line is held until the next newline or until flush_partial() is called.
 * Safe to write from several threads; each emitted line comes from one
 * thread's output.
 */
class LogStreamBuf : public std::streambuf {
public:
    static constexpr size_t MaxLineLength = 1000;

    explicit LogStreamBuf(LineSink sink);
    ~LogStreamBuf() override;

    LogStreamBuf(const LogStreamBuf&) = delete;
    LogStreamBuf& operator=(const LogStreamBuf&) = delete;

    /// Emit any buffered partial line
    void flush_partial();

    /**
     * @brief Emit any partial line to the current sink, then switch sinks.
     *
     * When this returns no thread is still inside the previous sink.
     * @return The previous sink
     */
    LineSink replace_sink(LineSink sink);

protected:
    int_type overflow(int_type ch) override;
    std::streamsize xsputn(const char* s, std::streamsize count) override;
    int sync() override;

private:
    void put_locked(char ch);
    void emit_locked();

    LineSink sink_;
    std::mutex mutex_;
    std::string line_;
};

/**
 * @brief RAII routing of std::cout and std::cerr to a line sink.
 *
 * The first redirect points both streams at one process-wide LogStreamBuf
 * and they stay there for the rest of the process, so a thread still
 * printing while a redirect ends never races a stream-buffer swap. Each
 * redirect installs its sink on that buffer; the destructor flushes a
 * pending partial line and puts the previous sink back. Without a
 * redirect, lines go to the C stderr stream.
 */
class StdioRedirect {
public:
    explicit StdioRedirect(LineSink sink);
    ~StdioRedirect();

    StdioRedirect(const StdioRedirect&) = delete;
    StdioRedirect& operator=(const StdioRedirect&) = delete;

    /// The buffer std::cout and std::cerr write to once redirected
    static LogStreamBuf& buffer();

private:
    LineSink previous_;
};

} // namespace droidglue
