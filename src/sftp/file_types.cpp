#include "file_types.hpp"

std::string describe_mode(OpenMode mode) {
    static const struct { OpenMode flag; const char* name; } names[] = {
        {OpenMode::Read, "read"},
        {OpenMode::Write, "write"},
        {OpenMode::Create, "create"},
        {OpenMode::Truncate, "truncate"},
        {OpenMode::Append, "append"},
        {OpenMode::Binary, "binary"},
    };

    std::string out;
    for (const auto& n : names) {
        if (!has_mode(mode, n.flag)) continue;
        if (!out.empty()) out += "|";
        out += n.name;
    }
    return out.empty() ? "none" : out;
}

const char* access_name(FileAccess access) {
    switch (access) {
        case FileAccess::None:      return "none";
        case FileAccess::Read:      return "read";
        case FileAccess::Write:     return "write";
        case FileAccess::ReadWrite: return "read_write";
    }
    return "none";
}

FileInfo to_file_info(const RawAttributes& attrs) {
    FileInfo info;
    info.size = attrs.has_size ? attrs.size : 0;

    if (attrs.has_permissions) {
        bool r = (attrs.permissions & 0400) != 0;
        bool w = (attrs.permissions & 0200) != 0;
        if (r && w)      info.access = FileAccess::ReadWrite;
        else if (r)      info.access = FileAccess::Read;
        else if (w)      info.access = FileAccess::Write;
    }

    if (attrs.has_times) {
        info.last_read = attrs.atime;
        info.last_write = attrs.mtime;
    }
    return info;
}
