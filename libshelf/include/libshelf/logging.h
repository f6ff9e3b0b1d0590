//
// Created by cv2 on 10/12/25.
//

#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <source_location> // C++20, but essential for good logging

#include "libshelf/ui.h"

namespace shelf::log {

    // Worker threads log concurrently, so every write goes through this lock.
    inline std::mutex& output_mutex() {
        static std::mutex mtx;
        return mtx;
    }

    inline std::atomic<bool>& verbose_flag() {
        static std::atomic<bool> verbose{false};
        return verbose;
    }

    inline void set_verbose(bool verbose) {
        verbose_flag().store(verbose);
    }

    // Helper function to format the output consistently
    inline void print(const std::string& level, const std::string& color_code, const std::string& msg) {
        std::lock_guard<std::mutex> lock(output_mutex());
        std::cout << color_code << "[  " << level << "  ] > " << "\033[0m" << msg << std::endl;
    }

    inline void ok(const std::string& msg) {
        print("OKY", "\033[1;32m", msg); // Bold Green
    }

    inline void error(const std::string& msg, const std::source_location& loc = std::source_location::current()) {
        std::string full_msg = msg + " (at " + loc.file_name() + ":" + std::to_string(loc.line()) + ")";
        print("ERR", "\033[1;31m", full_msg); // Bold Red
    }

    inline void info(const std::string& msg) {
        print("LOG", "\033[1;34m", msg); // Bold Blue
    }

    inline void warn(const std::string& msg) {
        print("WRN", "\033[1;33m", msg); // Bold Yellow
    }

    inline void debug(const std::string& msg) {
        if (verbose_flag().load()) {
            print("DBG", "\033[0;36m", msg); // Cyan
        }
    }

    // Prints a progress message without a newline, and flushes the output.
    // This is for showing what is currently happening. When stdout is not a
    // terminal each message gets its own line instead.
    inline void progress(const std::string& msg) {
        if (!ui::is_interactive()) {
            print("..", "\033[1;34m", msg);
            return;
        }
        std::lock_guard<std::mutex> lock(output_mutex());
        // \r: Carriage return (moves cursor to the beginning of the line)
        // \033[K: Erase from the cursor to the end of the line
        std::cout << "\r\033[K"
                  << "\033[1;34m" << "[..] > " << "\033[0m" // Blue header
                  << msg << std::flush;
    }

    // Prints a green "[OK]" message and finally moves to the next line.
    inline void progress_ok() {
        std::lock_guard<std::mutex> lock(output_mutex());
        if (!ui::is_interactive()) {
            std::cout << "[  OKY  ] > done" << std::endl;
            return;
        }
        std::cout << " [" << "\033[1;32m" << "  OKY  " << "\033[0m" << "]" << std::endl;
    }

} // namespace shelf::log
