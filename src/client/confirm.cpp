#include "client/confirm.hpp"

#include "util/console_line.hpp"

#include <cctype>
#include <mutex>

namespace xfer {

bool ConsoleConfirm::Ask(const std::string& question) {
    {
        std::lock_guard<std::mutex> lk(ConsoleMutex());
        ClearProgressLine();
        std::fprintf(out_, "%s [y/N] ", question.c_str());
        std::fflush(out_);
    }

    std::string answer;
    int c;
    while ((c = std::fgetc(in_)) != EOF && c != '\n') {
        if (!std::isspace(c)) answer.push_back(static_cast<char>(std::tolower(c)));
    }
    if (c == EOF) std::fputc('\n', out_);
    return answer == "y" || answer == "yes";
}

} // namespace xfer
