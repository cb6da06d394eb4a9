#pragma once

#include <string>

namespace swissdesk::core::util {

class AtomicFileWriter {
public:
    // Writes |contents| to "<path>.tmp" and renames it over |path|.
    static bool Write(const std::string& path, const std::string& contents);
};

}  // namespace swissdesk::core::util
