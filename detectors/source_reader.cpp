#include "detectors/source_reader.h"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "common/logging.h"
#include "common/utf8_utils.h"

namespace LayerGuard {

const char* readStatusToString(ReadStatus status) noexcept {
    switch (status) {
        case ReadStatus::Ok:         return "ok";
        case ReadStatus::Unreadable: return "unreadable";
        case ReadStatus::NotUtf8:    return "not valid UTF-8";
        default:                     return "unknown";
    }
}

bool isValidUtf8(std::string_view bytes) noexcept {
    return Common::isValidUtf8(bytes);
}

std::string_view trimView(std::string_view text) noexcept {
    constexpr std::string_view WHITESPACE = " \t\r\n\f\v";
    const std::size_t begin = text.find_first_not_of(WHITESPACE);
    if (begin == std::string_view::npos) {
        return {};
    }
    const std::size_t end = text.find_last_not_of(WHITESPACE);
    return text.substr(begin, end - begin + 1);
}

std::vector<std::string> splitLines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

ReadStatus readTextFile(const std::string& path, std::string* text) noexcept {
    text->clear();

    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        LOG_WARN("Failed to open file: %s", path.c_str());
        return ReadStatus::Unreadable;
    }

    struct stat sb;
    if (fstat(fd, &sb) < 0 || !S_ISREG(sb.st_mode)) {
        close(fd);
        LOG_WARN("Not a readable regular file: %s", path.c_str());
        return ReadStatus::Unreadable;
    }

    if (sb.st_size == 0) {
        close(fd);
        return ReadStatus::Ok;
    }

    const auto size = static_cast<std::size_t>(sb.st_size);
    const char* content = static_cast<const char*>(
        mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0)
    );
    if (content == MAP_FAILED) {
        close(fd);
        LOG_WARN("Failed to map file: %s", path.c_str());
        return ReadStatus::Unreadable;
    }

    const std::string_view bytes(content, size);
    const bool valid = isValidUtf8(bytes);
    if (valid) {
        text->assign(bytes);
    }

    munmap(const_cast<char*>(content), size);
    close(fd);

    if (!valid) {
        LOG_WARN("File is not valid UTF-8: %s", path.c_str());
        return ReadStatus::NotUtf8;
    }
    return ReadStatus::Ok;
}

ReadStatus readSourceLines(const std::string& path, std::vector<std::string>* lines) noexcept {
    lines->clear();
    std::string text;
    const ReadStatus status = readTextFile(path, &text);
    if (status == ReadStatus::Ok) {
        *lines = splitLines(text);
    }
    return status;
}

std::optional<Violation> unreadableViolation(const std::string& path,
                                             ReadStatus status,
                                             UnreadablePolicy policy) {
    if (status == ReadStatus::Ok || policy == UnreadablePolicy::Skip) {
        return std::nullopt;
    }
    std::string detail = "Source file could not be scanned: ";
    detail += readStatusToString(status);
    return Violation(path, 0, ViolationKind::UNREADABLE_FILE, std::move(detail));
}

} // namespace LayerGuard
