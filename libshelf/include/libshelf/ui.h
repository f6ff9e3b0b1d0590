#pragma once

#include <cstdlib>
#include <istream>
#include <string>
#include <unistd.h> // For isatty, STDIN_FILENO and STDOUT_FILENO

namespace shelf::ui {

    /**
     * @brief Checks if standard output is a terminal that can take cursor movement.
     * @return False when output is piped or redirected to a file.
     */
    inline bool is_interactive() {
        return isatty(STDOUT_FILENO) != 0;
    }

    /**
     * @brief Checks if a question can be put to the user and answered.
     * Both ends must be terminals; a piped stdin never answers.
     */
    inline bool can_prompt() {
        return isatty(STDIN_FILENO) != 0 && is_interactive();
    }

    // Honours the NO_COLOR convention (any non-empty value disables colour).
    inline bool use_color() {
        const char* no_color = std::getenv("NO_COLOR");
        return is_interactive() && (no_color == nullptr || no_color[0] == '\0');
    }

    /**
     * @brief Reads the answer to a [Y/n] question from `in`.
     * An empty line means yes. No way to ask, or no answer at all, means no.
     */
    inline bool read_confirmation(std::istream& in, bool prompt_possible) {
        if (!prompt_possible) {
            return false;
        }
        std::string response;
        if (!std::getline(in, response)) {
            return false;
        }
        return response.empty() || response[0] == 'y' || response[0] == 'Y';
    }

} // namespace shelf::ui
