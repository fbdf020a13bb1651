#include "mbus/MBusScanner.hxx"
#include "mbus/MBusDataRecords.hxx"
#include "system/Logger.hxx"

namespace mbusMQTT {
    static constexpr char TAG[] = "MBusScanner";

    namespace {
        struct WorkItem {
            size_t position;
            std::string mask;
            uint8_t next_digit;
        };

        bool hasWildcard(const std::string_view mask) {
            return mask.find('F') != std::string_view::npos;
        }
    }

    MBusScanner::MBusScanner(MBusAdapter& adapter, ScanOptions options)
        : m_adapter(adapter), m_options(std::move(options)) {
        m_options.start_mask = utils::toUpper(m_options.start_mask);
    }

    ProbeResult MBusScanner::probeOnce(const std::string_view mask) {
        ProbeResult result;

        const auto select = m_adapter.selectSecondary(mask);
        if (select.status == BusStatus::IoError) {
            result.outcome = ProbeOutcome::IoError;
            return result;
        }
        if (select.status == BusStatus::NoReply) {
            return result;
        }
        if (select.kind != Frames::ReplyKind::Ack) {
            // Наложение ответов нескольких счётчиков
            result.outcome = ProbeOutcome::Invalid;
            return result;
        }

        const auto data = m_adapter.requestData(common::AddressNetworkLayer, m_adapter.timing().probe_settle);
        if (data.status == BusStatus::IoError) {
            result.outcome = ProbeOutcome::IoError;
            return result;
        }
        if (data.status == BusStatus::NoReply) {
            return result;
        }
        if (data.kind != Frames::ReplyKind::Long) {
            result.outcome = ProbeOutcome::Invalid;
            return result;
        }

        result.outcome = ProbeOutcome::Match;
        result.address = std::string(mask);
        if (const auto header = DataRecords::decodeHeader(data.frame.data)) {
            const auto decoded = DataRecords::secondaryAddress(*header);
            if (Frames::maskMatches(mask, decoded)) {
                result.address = decoded;
            } else {
                MBUS_LOGW(TAG, "Reply address %s does not match mask %.*s",
                          decoded.c_str(), static_cast<int>(mask.size()), mask.data());
            }
        }
        return result;
    }

    ProbeResult MBusScanner::probe(const std::string_view mask, const bool full_depth) {
        ProbeResult result;
        for (uint32_t attempt = 0; attempt <= m_options.probe_retries; ++attempt) {
            result = probeOnce(mask);
            if (result.outcome != ProbeOutcome::Invalid) {
                return result;
            }
            MBUS_LOGD(TAG, "Ambiguous reply for %.*s, attempt %u",
                      static_cast<int>(mask.size()), mask.data(), attempt + 1);
        }

        if (full_depth) {
            MBUS_LOGW(TAG, "Invalid reply for fully specified address %.*s, skipping",
                      static_cast<int>(mask.size()), mask.data());
            result.outcome = ProbeOutcome::Invalid;
        } else {
            result.outcome = ProbeOutcome::Collision;
        }
        return result;
    }

    gw_err_t MBusScanner::scanSecondary(ScanResult& result, std::set<std::string>& seen) {
        const auto& start = m_options.start_mask;
        if (start.size() != common::SecondaryAddressLength || !utils::isHexString(start)) {
            MBUS_LOGE(TAG, "Invalid scan mask '%s'", start.c_str());
            return GW_ERR_INVALID_ARG;
        }

        auto record = [&](const ProbeResult& probe_result) {
            if (seen.insert(probe_result.address).second) {
                result.devices.push_back(MBusAddress::fromSecondary(probe_result.address));
                MBUS_LOGI(TAG, "Found secondary address %s", probe_result.address.c_str());
            }
        };

        // Стек позиций: порядок обхода совпадает с рекурсивным вариантом, глубина не больше 16
        std::vector<WorkItem> worklist;
        worklist.reserve(common::SecondaryAddressLength);
        worklist.push_back({0, start, 0});

        while (!worklist.empty()) {
            WorkItem& item = worklist.back();
            const size_t pos = item.position;

            if (item.mask[pos] != 'F') {
                if (pos + 1 < common::SecondaryAddressLength) {
                    item.position++;
                    continue;
                }
                // Полностью заданный адрес: один опрос
                const std::string mask = item.mask;
                worklist.pop_back();
                result.probes++;
                result.max_depth = std::max<uint32_t>(result.max_depth, static_cast<uint32_t>(pos + 1));
                const auto probe_result = probe(mask, true);
                if (probe_result.outcome == ProbeOutcome::IoError) return GW_ERR_IO;
                if (probe_result.outcome == ProbeOutcome::Match) record(probe_result);
                continue;
            }

            if (item.next_digit > 9) {
                worklist.pop_back();
                continue;
            }

            std::string mask = item.mask;
            mask[pos] = static_cast<char>('0' + item.next_digit);
            item.next_digit++;

            const bool full_depth = !hasWildcard(mask);
            result.probes++;
            result.max_depth = std::max<uint32_t>(result.max_depth, static_cast<uint32_t>(pos + 1));

            const auto probe_result = probe(mask, full_depth);
            switch (probe_result.outcome) {
                case ProbeOutcome::Match:
                    record(probe_result);
                    break;
                case ProbeOutcome::Collision:
                    MBUS_LOGD(TAG, "Collision at %s, descending", mask.c_str());
                    // item is invalidated by push_back
                    worklist.push_back({pos + 1, std::move(mask), 0});
                    break;
                case ProbeOutcome::IoError:
                    return GW_ERR_IO;
                case ProbeOutcome::NoReply:
                case ProbeOutcome::Invalid:
                    break;
            }
        }
        return GW_OK;
    }

    gw_err_t MBusScanner::scanPrimary(ScanResult& result, std::set<std::string>& seen) {
        if (m_options.primary_first > m_options.primary_last) {
            return GW_OK;
        }
        const uint8_t last = std::min(m_options.primary_last, common::AddressMaxPrimary);

        for (uint32_t addr = m_options.primary_first; addr <= last; ++addr) {
            const auto address = static_cast<uint8_t>(addr);
            result.probes++;
            if (!m_adapter.ping(address)) {
                continue;
            }

            const auto reply = m_adapter.requestData(address, m_adapter.timing().read_settle);
            if (reply.status == BusStatus::IoError) {
                return GW_ERR_IO;
            }
            if (reply.kind != Frames::ReplyKind::Long) {
                MBUS_LOGW(TAG, "Primary address %u acknowledged but sent no data", address);
                continue;
            }

            if (const auto header = DataRecords::decodeHeader(reply.frame.data)) {
                const auto secondary = DataRecords::secondaryAddress(*header);
                if (seen.contains(secondary)) {
                    MBUS_LOGD(TAG, "Primary address %u is already known as %s", address, secondary.c_str());
                    continue;
                }
                seen.insert(secondary);
            }
            if (seen.insert(std::to_string(address)).second) {
                result.devices.push_back(MBusAddress::fromPrimary(address));
                MBUS_LOGI(TAG, "Found primary address %u", address);
            }
        }
        return GW_OK;
    }

    ScanResult MBusScanner::scan() {
        std::lock_guard<std::recursive_mutex> lock(m_adapter.busMutex());
        ScanResult result;
        std::set<std::string> seen;

        MBUS_LOGI(TAG, "Starting bus scan (mask %s, primary %u..%u)",
                  m_options.start_mask.c_str(), m_options.primary_first, m_options.primary_last);

        m_adapter.initSlaves();

        if (m_options.secondary_enabled) {
            result.status = scanSecondary(result, seen);
        }
        if (result.status == GW_OK) {
            // Снять выбор вторичного адреса перед опросом первичных
            m_adapter.initSlaves();
            result.status = scanPrimary(result, seen);
        }

        if (result.status != GW_OK) {
            MBUS_LOGE(TAG, "Scan aborted: %s", gwErrToName(result.status));
        }
        MBUS_LOGI(TAG, "Scan finished: %zu device(s), %u probes, depth %u",
                  result.devices.size(), result.probes, result.max_depth);
        return result;
    }
} // mbusMQTT
