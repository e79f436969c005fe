#include "stowage/framing.hpp"

namespace stowage::protocol
{

    namespace
    {
        constexpr char kDelimiter = '\n';
    } // namespace

    std::string encode_line(const nlohmann::json &message)
    {
        auto text = message.dump();
        text.push_back(kDelimiter);
        return text;
    }

    std::optional<DecodedLine> try_decode_line(std::string_view buffer)
    {
        std::size_t start = 0;
        while (start < buffer.size())
        {
            const auto end = buffer.find(kDelimiter, start);
            if (end == std::string_view::npos)
            {
                return std::nullopt;
            }
            auto line = buffer.substr(start, end - start);
            if (!line.empty() && line.back() == '\r')
            {
                line.remove_suffix(1);
            }
            if (line.empty())
            {
                start = end + 1;
                continue;
            }
            DecodedLine result{
                .message = nlohmann::json::parse(line),
                .bytes_consumed = end + 1,
            };
            return result;
        }
        return std::nullopt;
    }

} // namespace stowage::protocol
