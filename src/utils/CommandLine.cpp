#include <CommandLine.hpp>
#include <LogCompat.hpp>
#include <filesystem>
#include <stdexcept>
#include <string_view>
#include <system_error>

CommandLine::CommandLine(CommandLine::argc_type argc,
                         CommandLine::argv_type argv)
    : _argc(argc), _argv(argv) {
    if (_argv == nullptr || _argc < 1 || _argv[0] == nullptr) {
        LOG(ERROR) << "Invalid argv passed";
        throw std::invalid_argument("Invalid argv passed");
    }

    std::error_code ec;
    exePath = std::filesystem::absolute(argv[0], ec);
    if (ec) {
        DLOG(WARNING) << argv[0] << ": " << ec.message();
        exePath = argv[0];
    }
}

CommandLine::argv_type CommandLine::argv() const { return _argv; }

CommandLine::argc_type CommandLine::argc() const { return _argc; }

std::filesystem::path CommandLine::exe() const { return exePath; }

bool CommandLine::operator==(const CommandLine& other) const {
    if (_argc != other._argc) {
        return false;
    }
    for (int i = 0; i < _argc; ++i) {
        if (std::string_view(_argv[i]) != std::string_view(other._argv[i])) {
            return false;
        }
    }
    return true;
}
