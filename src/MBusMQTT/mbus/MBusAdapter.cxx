// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "mbus/MBusAdapter.hxx"
#include "system/Logger.hxx"

namespace mbusMQTT {
    static constexpr char TAG[] = "MBusAdapter";
    static constexpr size_t MAX_FRAME_LENGTH = 255 + common::FrameLongOverhead;

    MBusAdapter::MBusAdapter(IBusTransport& transport, BusTiming timing)
        : m_transport(transport), m_timing(timing) {}

    gw_err_t MBusAdapter::ensureOpen() {
        if (m_transport.isOpen()) return GW_OK;
        const gw_err_t err = m_transport.open();
        if (err != GW_OK) {
            MBUS_LOGE(TAG, "Bus transport unavailable: %s", gwErrToName(err));
        }
        return err;
    }

    void MBusAdapter::closePort() {
        std::lock_guard<std::recursive_mutex> lock(m_bus_mutex);
        m_transport.close();
    }

    gw_err_t MBusAdapter::send(const Frames::Frame& frame) {
        std::lock_guard<std::recursive_mutex> lock(m_bus_mutex);

        if (const gw_err_t err = ensureOpen(); err != GW_OK) {
            return err;
        }
        m_transport.flushInput();
        const gw_err_t err = m_transport.write(frame);
        if (err != GW_OK) {
            // Порт переоткроется при следующей операции
            m_transport.close();
        }
        return err;
    }

    BusReply MBusAdapter::receive() {
        BusReply reply;
        std::array<uint8_t, MAX_FRAME_LENGTH> buf{};

        int n = m_transport.read(buf.data(), 1, m_timing.reply_timeout);
        if (n < 0) {
            reply.status = BusStatus::IoError;
            m_transport.close();
            return reply;
        }
        if (n == 0) {
            reply.status = BusStatus::NoReply;
            return reply;
        }
        reply.raw.push_back(buf[0]);

        while (reply.raw.size() < MAX_FRAME_LENGTH) {
            const int expected = Frames::expectedLength(reply.raw);
            if (expected > 0 && reply.raw.size() >= static_cast<size_t>(expected)) {
                break;
            }
            // Start byte is not a frame: still swallow the rest of the garbage
            const size_t want = expected > 0
                ? static_cast<size_t>(expected) - reply.raw.size()
                : 1;
            n = m_transport.read(buf.data(), std::min(want, buf.size()), m_timing.inter_byte_timeout);
            if (n < 0) {
                reply.status = BusStatus::IoError;
                m_transport.close();
                return reply;
            }
            if (n == 0) break;
            reply.raw.insert(reply.raw.end(), buf.begin(), buf.begin() + n);
        }

        reply.status = BusStatus::Ok;
        reply.kind = Frames::classify(reply.raw, &reply.frame);
        if (reply.kind == Frames::ReplyKind::Invalid) {
            MBUS_LOGD(TAG, "Invalid reply (%zu bytes)", reply.raw.size());
        }
        return reply;
    }

    BusReply MBusAdapter::transact(const Frames::Frame& frame, const std::chrono::milliseconds settle) {
        std::lock_guard<std::recursive_mutex> lock(m_bus_mutex);

        if (send(frame) != GW_OK) {
            BusReply reply;
            reply.status = BusStatus::IoError;
            return reply;
        }
        if (settle.count() > 0) {
            std::this_thread::sleep_for(settle);
        }
        return receive();
    }

    bool MBusAdapter::ping(const uint8_t address) {
        std::lock_guard<std::recursive_mutex> lock(m_bus_mutex);

        for (uint32_t attempt = 0; attempt <= m_timing.ping_retries; ++attempt) {
            const auto reply = transact(Frames::Factory::Ping(address));
            if (reply.status == BusStatus::IoError) {
                return false;
            }
            if (reply.kind == Frames::ReplyKind::Ack) {
                return true;
            }
            if (attempt < m_timing.ping_retries && m_timing.ping_retry_delay.count() > 0) {
                std::this_thread::sleep_for(m_timing.ping_retry_delay);
            }
        }
        MBUS_LOGD(TAG, "No ACK from address %u", address);
        return false;
    }

    bool MBusAdapter::initSlaves() {
        std::lock_guard<std::recursive_mutex> lock(m_bus_mutex);

        if (ping(common::AddressNetworkLayer)) {
            return true;
        }
        // Broadcast без ответа, ACK не ожидается
        if (send(Frames::Factory::Ping(common::AddressBroadcastNoReply)) != GW_OK) {
            return false;
        }
        MBUS_LOGD(TAG, "Network layer did not acknowledge, sent broadcast SND_NKE");
        return false;
    }

    BusReply MBusAdapter::selectSecondary(const std::string_view mask) {
        const auto frame = Frames::Factory::SelectSecondary(mask);
        if (!frame) {
            MBUS_LOGE(TAG, "Malformed secondary mask '%.*s'", static_cast<int>(mask.size()), mask.data());
            BusReply reply;
            reply.status = BusStatus::IoError;
            return reply;
        }
        return transact(*frame);
    }

    BusReply MBusAdapter::requestData(const uint8_t address, const std::chrono::milliseconds settle) {
        return transact(Frames::Factory::RequestData(address), settle);
    }
} // mbusMQTT
