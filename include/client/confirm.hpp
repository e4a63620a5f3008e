#pragma once

#include <cstdio>
#include <string>

namespace xfer {

// Synchronous yes/no gate before a transfer does anything irreversible.
class IConfirm {
  public:
    virtual ~IConfirm() = default;
    virtual bool Ask(const std::string& question) = 0;
};

// Prompts on the terminal. Anything but y/yes, including EOF, means no.
class ConsoleConfirm final : public IConfirm {
  public:
    ConsoleConfirm(std::FILE* in = stdin, std::FILE* out = stderr) : in_(in), out_(out) {}
    bool Ask(const std::string& question) override;

  private:
    std::FILE* in_;
    std::FILE* out_;
};

// For --yes.
class AlwaysConfirm final : public IConfirm {
  public:
    bool Ask(const std::string&) override { return true; }
};

} // namespace xfer
