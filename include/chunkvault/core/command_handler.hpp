#pragma once

#include "chunkvault/transfer/transfer_types.hpp"
#include <string>
#include <vector>

namespace chunkvault::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }

    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

// Options shared by every command, taken from the command line
struct CommandOptions {
    transfer::JobPriority priority = transfer::JobPriority::NORMAL;
    bool reassemble = true;
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class PlanCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show how a file would be chunked"; }
    std::string get_usage() const override { return "chunkvault plan <file>"; }
};

class UploadCommandHandler : public CommandHandler {
public:
    explicit UploadCommandHandler(CommandOptions options);

    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Upload a file in chunks, resuming earlier attempts"; }
    std::string get_usage() const override {
        return "chunkvault [--priority <level>] [--no-reassemble] upload <file>";
    }

private:
    CommandOptions options_;
};

class ReassembleCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Rebuild an uploaded file from its chunks"; }
    std::string get_usage() const override { return "chunkvault reassemble <file-id>"; }
};

class StatusCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show persisted transfer progress"; }
    std::string get_usage() const override { return "chunkvault status [file-id]"; }
};

class CancelCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Drop the transfer state of a file"; }
    std::string get_usage() const override { return "chunkvault cancel <file-id>"; }
};

} // namespace chunkvault::core
