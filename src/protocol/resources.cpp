#include "protocol/resources.hpp"
#include <cctype>

namespace rosgate
{
    namespace protocol
    {

        namespace
        {
            std::string field(const Attributes &attributes, const std::string &key)
            {
                auto it = attributes.find(key);
                return it != attributes.end() ? it->second : std::string();
            }

            // "HH:MM:SS" (hours may exceed 24)
            uint64_t parse_clock(const std::string &text)
            {
                uint64_t total = 0;
                uint64_t part = 0;
                for (char c : text)
                {
                    if (std::isdigit(static_cast<unsigned char>(c)))
                    {
                        part = part * 10 + static_cast<uint64_t>(c - '0');
                    }
                    else if (c == ':')
                    {
                        total = total * 60 + part;
                        part = 0;
                    }
                    else if (c == '.')
                    {
                        // fractional seconds
                        break;
                    }
                    else
                    {
                        return 0;
                    }
                }
                return total * 60 + part;
            }
        } // namespace

        uint64_t parse_duration_seconds(const std::string &text)
        {
            if (text.empty())
            {
                return 0;
            }

            uint64_t total = 0;
            uint64_t number = 0;
            bool have_number = false;

            for (size_t i = 0; i < text.size(); ++i)
            {
                char c = text[i];
                if (std::isdigit(static_cast<unsigned char>(c)))
                {
                    number = number * 10 + static_cast<uint64_t>(c - '0');
                    have_number = true;
                    continue;
                }

                if (c == ':')
                {
                    // Remainder is a clock; rewind to the start of its hour field
                    size_t start = i;
                    while (start > 0 && std::isdigit(static_cast<unsigned char>(text[start - 1])))
                    {
                        --start;
                    }
                    return total + parse_clock(text.substr(start));
                }

                uint64_t unit = 0;
                switch (c)
                {
                case 'w':
                    unit = 7 * 24 * 3600;
                    break;
                case 'd':
                    unit = 24 * 3600;
                    break;
                case 'h':
                    unit = 3600;
                    break;
                case 'm':
                    if (i + 1 < text.size() && text[i + 1] == 's')
                    {
                        // milliseconds
                        ++i;
                        number = 0;
                        have_number = false;
                        continue;
                    }
                    unit = 60;
                    break;
                case 's':
                    unit = 1;
                    break;
                default:
                    return 0;
                }

                if (!have_number)
                {
                    return 0;
                }
                total += number * unit;
                number = 0;
                have_number = false;
            }

            // A bare trailing number counts as seconds
            return total + number;
        }

        uint64_t parse_counter(const std::string &text)
        {
            uint64_t value = 0;
            if (text.empty())
            {
                return 0;
            }
            for (char c : text)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                {
                    return 0;
                }
                value = value * 10 + static_cast<uint64_t>(c - '0');
            }
            return value;
        }

        bool parse_flag(const std::string &text)
        {
            return text == "true" || text == "yes";
        }

        // SystemResource implementation
        SystemResource SystemResource::from_attributes(const Attributes &attributes)
        {
            SystemResource resource;
            resource.version = field(attributes, "version");
            resource.uptime_seconds = parse_duration_seconds(field(attributes, "uptime"));
            resource.cpu_load_percent = static_cast<uint32_t>(parse_counter(field(attributes, "cpu-load")));
            resource.free_memory_bytes = parse_counter(field(attributes, "free-memory"));
            resource.total_memory_bytes = parse_counter(field(attributes, "total-memory"));
            resource.board_name = field(attributes, "board-name");
            resource.architecture = field(attributes, "architecture-name");
            resource.identity = resource.board_name;
            return resource;
        }

        nlohmann::json SystemResource::to_json() const
        {
            return nlohmann::json{
                {"identity", identity},
                {"version", version},
                {"uptime_seconds", uptime_seconds},
                {"cpu_load_percent", cpu_load_percent},
                {"free_memory_bytes", free_memory_bytes},
                {"total_memory_bytes", total_memory_bytes},
                {"board_name", board_name},
                {"architecture", architecture}};
        }

        // NetworkInterface implementation
        NetworkInterface NetworkInterface::from_attributes(const Attributes &attributes)
        {
            NetworkInterface iface;
            iface.id = field(attributes, ".id");
            iface.name = field(attributes, "name");
            iface.type = field(attributes, "type");
            iface.running = parse_flag(field(attributes, "running"));
            iface.disabled = parse_flag(field(attributes, "disabled"));
            iface.rx_bytes = parse_counter(field(attributes, "rx-byte"));
            iface.tx_bytes = parse_counter(field(attributes, "tx-byte"));
            iface.rx_packets = parse_counter(field(attributes, "rx-packet"));
            iface.tx_packets = parse_counter(field(attributes, "tx-packet"));
            return iface;
        }

        nlohmann::json NetworkInterface::to_json() const
        {
            return nlohmann::json{
                {"id", id},
                {"name", name},
                {"type", type},
                {"running", running},
                {"disabled", disabled},
                {"rx_bytes", rx_bytes},
                {"tx_bytes", tx_bytes},
                {"rx_packets", rx_packets},
                {"tx_packets", tx_packets}};
        }

        // HotspotActive implementation
        HotspotActive HotspotActive::from_attributes(const Attributes &attributes)
        {
            HotspotActive active;
            active.id = field(attributes, ".id");
            active.user = field(attributes, "user");
            active.address = field(attributes, "address");
            active.mac_address = field(attributes, "mac-address");
            active.uptime_seconds = parse_duration_seconds(field(attributes, "uptime"));
            active.bytes_in = parse_counter(field(attributes, "bytes-in"));
            active.bytes_out = parse_counter(field(attributes, "bytes-out"));
            return active;
        }

        nlohmann::json HotspotActive::to_json() const
        {
            return nlohmann::json{
                {"id", id},
                {"user", user},
                {"address", address},
                {"mac_address", mac_address},
                {"uptime_seconds", uptime_seconds},
                {"bytes_in", bytes_in},
                {"bytes_out", bytes_out}};
        }

        // HotspotUser implementation
        HotspotUser HotspotUser::from_attributes(const Attributes &attributes)
        {
            HotspotUser user;
            user.id = field(attributes, ".id");
            user.name = field(attributes, "name");
            user.profile = field(attributes, "profile");
            user.disabled = parse_flag(field(attributes, "disabled"));
            return user;
        }

        nlohmann::json HotspotUser::to_json() const
        {
            return nlohmann::json{
                {"id", id},
                {"name", name},
                {"profile", profile},
                {"disabled", disabled}};
        }

    } // namespace protocol
} // namespace rosgate
