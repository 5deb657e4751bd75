#pragma once

#include "hubagent/io/fd.hpp"
#include "hubagent/util/result.hpp"

#include <string>

namespace hubagent {

// Staging file created next to its destination so that the final rename
// stays within one filesystem. Unlinked on destruction unless released.
class TempFile {
public:
    // Creates "<dir of destination>/.<basename>.XXXXXX" with mode 0600.
    static Result CreateFor(const std::string& destination, TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    int GetFd() const;
    const std::string& Path() const;

    // fsync(2) then close(2); both failures are reported.
    Result SyncAndClose();

    // The file now lives on under another name; stop tracking it.
    void Release();

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

} // namespace hubagent
