//
// Created by cv2 on 10/15/25.
//

#pragma once

#include <iostream>
#include <string>

#include <libshelf/diagnostics.h>
#include <libshelf/operation.h>
#include <libshelf/ui.h>

namespace ui {

// --- ANSI Color Codes ---
    inline const char* const RESET = "\033[0m";
    inline const char* const BOLD = "\033[1m";
    inline const char* const BLUE = "\033[1;34m";
    inline const char* const GREEN = "\033[0;32m";
    inline const char* const RED = "\033[1;31m";
    inline const char* const YELLOW = "\033[1;33m";
    inline const char* const CYAN = "\033[0;36m";

    // Colour codes only reach a terminal that wants them.
    inline const char* paint(const char* code) {
        return shelf::ui::use_color() ? code : "";
    }

// --- Formatted Printing Functions ---

    inline void action(const std::string& msg) {
        std::cout << paint(BLUE) << ":: " << paint(RESET) << paint(BOLD) << msg << paint(RESET) << std::endl;
    }

    inline void header(const std::string& msg) {
        std::cout << paint(BOLD) << msg << paint(RESET) << std::endl;
    }

    inline void item(const std::string& msg) {
        std::cout << " " << paint(GREEN) << "-" << paint(RESET) << " " << msg << std::endl;
    }

    inline void error(const std::string& msg) {
        std::cerr << paint(RED) << "error: " << paint(RESET) << msg << std::endl;
    }

    inline void warning(const std::string& msg) {
        std::cout << paint(YELLOW) << "warning: " << paint(RESET) << msg << std::endl;
    }

    // Asks the user a "Yes/No" question. Without a terminal to ask on, the answer is no.
    inline bool confirm(const std::string& question) {
        if (!shelf::ui::can_prompt()) {
            warning(question + " Not asking without a terminal, assuming no.");
            return false;
        }
        std::cout << paint(CYAN) << ":: " << paint(RESET) << paint(BOLD) << question << " [Y/n] " << paint(RESET);
        return shelf::ui::read_confirmation(std::cin, true);
    }

    inline void print_progress(const shelf::OperationProgress& progress) {
        std::string line = "[" + progress.phase + "]";
        if (progress.percent) {
            line += " " + std::to_string(*progress.percent) + "%";
        }
        if (progress.eta) {
            line += " (~" + std::to_string(progress.eta->count()) + "s left)";
        }
        if (!progress.message.empty()) {
            line += " " + progress.message;
        }
        if (progress.confidence == shelf::ProgressConfidence::Low) {
            std::cout << paint(CYAN) << "   " << paint(RESET) << line << std::endl;
        } else {
            item(line);
        }
    }

    inline void print_check(const shelf::DiagnosticCheck& check) {
        const char* color = GREEN;
        if (check.status == shelf::CheckStatus::Warning) color = YELLOW;
        if (check.status == shelf::CheckStatus::Critical) color = RED;
        std::cout << " " << paint(color) << "[" << shelf::to_string(check.status) << "]" << paint(RESET) << " "
                  << paint(BOLD) << check.name << paint(RESET) << ": " << check.detail;
        if (check.remediation) {
            std::cout << " (fix: " << check.remediation->target() << ")";
        }
        std::cout << std::endl;
    }

} // namespace ui
