// Stream helpers
#pragma once
#include <istream>
#include <memory>
#include <string>

namespace symbolgate::infrastructure {

class StreamUtils {
public:
    /** @brief Reads the remainder of a stream. */
    static std::string ReadAll(std::istream& stream);

    /**
     * @brief Returns the stream itself if it supports seeking, otherwise an in-memory copy
     * positioned at the start.
     */
    static std::unique_ptr<std::istream> MakeSeekable(std::unique_ptr<std::istream> stream);
};

} // namespace symbolgate::infrastructure
