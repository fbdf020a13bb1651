// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MBUSMQTT_FILEHANDLER_HXX
#define MBUSMQTT_FILEHANDLER_HXX
#include <cstdio>

namespace mbusMQTT::utils {

// RAII wrapper for FILE handle
class FileHandle {
public:
    explicit FileHandle(const char* path, const char* mode) {
        m_file = fopen(path, mode);
    }

    ~FileHandle() {
        if (m_file) {
            fclose(m_file);
        }
    }

    [[nodiscard]] FILE* get() const { return m_file; }
    explicit operator bool() const { return m_file != nullptr; }

    // Whole file as a string, nullopt on read error
    [[nodiscard]] std::optional<std::string> readAll() const {
        if (!m_file) return std::nullopt;
        std::string content;
        char chunk[4096];
        size_t n = 0;
        while ((n = fread(chunk, 1, sizeof(chunk), m_file)) > 0) {
            content.append(chunk, n);
        }
        if (ferror(m_file)) return std::nullopt;
        return content;
    }

    [[nodiscard]] bool writeAll(std::string_view data) const {
        if (!m_file) return false;
        if (fwrite(data.data(), 1, data.size(), m_file) != data.size()) return false;
        return fflush(m_file) == 0;
    }

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;
private:
    FILE* m_file{nullptr};
};

} // mbusMQTT::utils
#endif //MBUSMQTT_FILEHANDLER_HXX
