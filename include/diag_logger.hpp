#pragma once
#include <fstream>
#include <mutex>
#include <string>

namespace relay {

// Append-only diagnostic log shared by all scan workers.
class DiagLogger {
public:
    explicit DiagLogger(const std::string& path);
    ~DiagLogger();

    DiagLogger(const DiagLogger&) = delete;
    DiagLogger& operator=(const DiagLogger&) = delete;

    bool ok() const { return out_.is_open(); }
    void log(const std::string& line);

private:
    std::mutex mu_;
    std::ofstream out_;
};

// Null-safe shorthand used at every call site that takes an optional logger.
inline void diag_log(DiagLogger* diag, const std::string& line) {
    if (diag) diag->log(line);
}

} // namespace relay
