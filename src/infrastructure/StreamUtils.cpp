#include "infrastructure/StreamUtils.hpp"
#include <sstream>
#include <stdexcept>

namespace symbolgate::infrastructure {

std::string StreamUtils::ReadAll(std::istream& stream) {
    std::string data;
    char buffer[64 * 1024];
    while (stream.read(buffer, sizeof(buffer)) || stream.gcount() > 0) {
        data.append(buffer, static_cast<size_t>(stream.gcount()));
    }
    if (stream.bad()) {
        throw std::runtime_error("Stream read failed");
    }
    return data;
}

std::unique_ptr<std::istream> StreamUtils::MakeSeekable(std::unique_ptr<std::istream> stream) {
    if (!stream) {
        throw std::invalid_argument("MakeSeekable: null stream");
    }

    auto start = stream->tellg();
    if (start != std::streampos(-1)) {
        stream->seekg(0, std::ios::end);
        bool seekable = static_cast<bool>(*stream);
        stream->clear();
        stream->seekg(start);
        if (seekable && *stream) {
            return stream;
        }
    }
    stream->clear();

    auto copy = std::make_unique<std::istringstream>(ReadAll(*stream), std::ios::in | std::ios::binary);
    return copy;
}

} // namespace symbolgate::infrastructure
