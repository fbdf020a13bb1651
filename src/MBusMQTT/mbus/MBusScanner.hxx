#ifndef MBUSMQTT_MBUSSCANNER_HXX
#define MBUSMQTT_MBUSSCANNER_HXX

#include "mbus/MBusAdapter.hxx"
#include "mbus/MBusTypes.hxx"

namespace mbusMQTT
{
    struct ScanOptions {
        std::string start_mask{common::SecondaryWildcardMask};
        bool secondary_enabled{true};
        uint32_t probe_retries{1};          // Re-probes of an invalid reply before it is a collision
        uint8_t primary_first{1};
        uint8_t primary_last{10};           // first > last disables primary probing
    };

    enum class ProbeOutcome : uint8_t {
        NoReply,
        Match,
        Collision,
        Invalid,    // Only at full depth: logged and pruned
        IoError
    };

    struct ProbeResult {
        ProbeOutcome outcome{ProbeOutcome::NoReply};
        std::string address{};              // Valid for Match
    };

    struct ScanResult {
        std::vector<MBusAddress> devices{};
        uint32_t probes{0};
        uint32_t max_depth{0};              // Deepest position that was instantiated
        gw_err_t status{GW_OK};
    };

    /**
     * Secondary address search over an explicit worklist plus primary address probing.
     * Holds the bus lock for the whole scan.
     */
    class MBusScanner {
    public:
        MBusScanner(MBusAdapter& adapter, ScanOptions options);

        [[nodiscard]] ScanResult scan();

        /**
         * @brief SELECT the mask and request data from 0xFD, re-probing invalid replies.
         * @param full_depth mask has no wildcard left, a collision verdict is impossible.
         */
        ProbeResult probe(std::string_view mask, bool full_depth);

        [[nodiscard]] const ScanOptions& options() const { return m_options; }

    private:
        ProbeResult probeOnce(std::string_view mask);
        gw_err_t scanSecondary(ScanResult& result, std::set<std::string>& seen);
        gw_err_t scanPrimary(ScanResult& result, std::set<std::string>& seen);

        MBusAdapter& m_adapter;
        ScanOptions m_options;
    };
} // mbusMQTT

#endif //MBUSMQTT_MBUSSCANNER_HXX
