// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef MBUSMQTT_MBUSADAPTER_HXX
#define MBUSMQTT_MBUSADAPTER_HXX

#include "mbus/driver/BusTransport.hxx"
#include "mbus/MBusFrames.hxx"

namespace mbusMQTT
{
    struct BusTiming {
        std::chrono::milliseconds reply_timeout{5000};     // wait for the first byte of a reply
        std::chrono::milliseconds inter_byte_timeout{100};
        std::chrono::milliseconds probe_settle{500};       // REQ_UD2 -> RSP_UD during scan
        std::chrono::milliseconds read_settle{300};        // REQ_UD2 -> RSP_UD during read
        std::chrono::milliseconds ping_retry_delay{500};
        uint32_t ping_retries{2};
    };

    enum class BusStatus : uint8_t {
        Ok,         // Something was received, see kind
        NoReply,
        IoError
    };

    struct BusReply {
        BusStatus status{BusStatus::NoReply};
        Frames::ReplyKind kind{Frames::ReplyKind::None};
        Frames::LongFrame frame{};   // Valid when kind == Long
        Frames::Frame raw{};
    };

    class MBusAdapter {
    public:
        MBusAdapter(IBusTransport& transport, BusTiming timing);

        MBusAdapter(const MBusAdapter&) = delete;
        MBusAdapter& operator=(const MBusAdapter&) = delete;

        /**
         * @brief Bus lock. Scans and reads hold it for their whole duration.
         */
        [[nodiscard]] std::recursive_mutex& busMutex() { return m_bus_mutex; }

        [[nodiscard]] const BusTiming& timing() const { return m_timing; }

        /**
         * @brief Send a frame and collect one reply.
         * @param settle pause between sending and listening.
         */
        BusReply transact(const Frames::Frame& frame, std::chrono::milliseconds settle = std::chrono::milliseconds{0});

        /**
         * @brief Send a frame that expects no reply.
         */
        gw_err_t send(const Frames::Frame& frame);

        /**
         * @brief SND_NKE with ping_retries extra attempts.
         * @return true when an ACK was received.
         */
        bool ping(uint8_t address);

        /**
         * @brief Normalize the bus: SND_NKE to 0xFD, falling back to 0xFF.
         */
        bool initSlaves();

        /**
         * @brief SELECT by (possibly wildcarded) secondary address.
         */
        BusReply selectSecondary(std::string_view mask);

        /**
         * @brief REQ_UD2 followed by the settle delay and the RSP_UD.
         */
        BusReply requestData(uint8_t address, std::chrono::milliseconds settle);

        void closePort();

    private:
        gw_err_t ensureOpen();
        BusReply receive();

        IBusTransport& m_transport;
        BusTiming m_timing;
        std::recursive_mutex m_bus_mutex{};
    };
} // mbusMQTT

#endif //MBUSMQTT_MBUSADAPTER_HXX
