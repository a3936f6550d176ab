#ifndef ROSGATE_PROTOCOL_RESOURCES_HPP
#define ROSGATE_PROTOCOL_RESOURCES_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/reply.hpp"

namespace rosgate
{
    namespace protocol
    {

        /**
         * /system/resource (+ /system/identity)
         */
        struct SystemResource
        {
            std::string identity;
            std::string version;
            uint64_t uptime_seconds = 0;
            uint32_t cpu_load_percent = 0;
            uint64_t free_memory_bytes = 0;
            uint64_t total_memory_bytes = 0;
            std::string board_name;
            std::string architecture;

            static SystemResource from_attributes(const Attributes &attributes);
            nlohmann::json to_json() const;
        };

        /**
         * /interface
         */
        struct NetworkInterface
        {
            std::string id;
            std::string name;
            std::string type;
            bool running = false;
            bool disabled = false;
            uint64_t rx_bytes = 0;
            uint64_t tx_bytes = 0;
            uint64_t rx_packets = 0;
            uint64_t tx_packets = 0;

            static NetworkInterface from_attributes(const Attributes &attributes);
            nlohmann::json to_json() const;
        };

        /**
         * /ip/hotspot/active
         */
        struct HotspotActive
        {
            std::string id;
            std::string user;
            std::string address;
            std::string mac_address;
            uint64_t uptime_seconds = 0;
            uint64_t bytes_in = 0;
            uint64_t bytes_out = 0;

            static HotspotActive from_attributes(const Attributes &attributes);
            nlohmann::json to_json() const;
        };

        /**
         * /ip/hotspot/user
         */
        struct HotspotUser
        {
            std::string id;
            std::string name;
            std::string profile;
            bool disabled = false;

            static HotspotUser from_attributes(const Attributes &attributes);
            nlohmann::json to_json() const;
        };

        /**
         * RouterOS durations: "1w2d3h4m5s", "3d04:05:06", "04:05:06" or plain seconds.
         * Sub-second parts ("250ms") are dropped; unparseable text yields 0.
         */
        uint64_t parse_duration_seconds(const std::string &text);

        /**
         * Unsigned 64-bit counter; empty or non-numeric text yields 0
         */
        uint64_t parse_counter(const std::string &text);

        bool parse_flag(const std::string &text);

        template <typename Record>
        std::vector<Record> records_from(const std::vector<Attributes> &rows)
        {
            std::vector<Record> records;
            records.reserve(rows.size());
            for (const auto &row : rows)
            {
                records.push_back(Record::from_attributes(row));
            }
            return records;
        }

        template <typename Record>
        nlohmann::json records_to_json(const std::vector<Record> &records)
        {
            nlohmann::json array = nlohmann::json::array();
            for (const auto &record : records)
            {
                array.push_back(record.to_json());
            }
            return array;
        }

    } // namespace protocol
} // namespace rosgate

#endif // ROSGATE_PROTOCOL_RESOURCES_HPP
