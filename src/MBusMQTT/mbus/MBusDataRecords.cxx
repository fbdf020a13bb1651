#include "mbus/MBusDataRecords.hxx"
#include "system/Logger.hxx"

namespace mbusMQTT::DataRecords {

    static constexpr char TAG[] = "MBusDataRecords";

    namespace {
        enum class ValueKind : uint8_t {
            Number,
            Date,
            DateTime,
            Identifier
        };

        struct VifInfo {
            std::string quantity{"Value"};
            std::string unit{};
            int exponent{0};
            ValueKind kind{ValueKind::Number};
            bool generic{true};
        };

        VifInfo known(std::string quantity, std::string unit, const int exponent, const ValueKind kind = ValueKind::Number) {
            return VifInfo{std::move(quantity), std::move(unit), exponent, kind, false};
        }

        VifInfo timeSpan(std::string quantity, const uint8_t nn) {
            static constexpr std::array<const char*, 4> units = {"s", "min", "h", "d"};
            return known(std::move(quantity), units[nn & 0x03], 0);
        }

        VifInfo primaryVif(const uint8_t raw_vif) {
            const uint8_t vif = raw_vif & 0x7F;
            const int n3 = vif & 0x07;
            const int n2 = vif & 0x03;

            if (vif <= 0x07) return known("Energy", "kWh", n3 - 6);   // Wh * 10^(n-3)
            if (vif <= 0x0F) return known("Energy", "MJ", n3 - 6);    // J * 10^n
            if (vif <= 0x17) return known("Volume", "m³", n3 - 6);
            if (vif <= 0x1F) return known("Mass", "kg", n3 - 3);
            if (vif <= 0x23) return timeSpan("On Time", static_cast<uint8_t>(n2));
            if (vif <= 0x27) return timeSpan("Operating Time", static_cast<uint8_t>(n2));
            if (vif <= 0x2F) return known("Power", "W", n3 - 3);
            if (vif <= 0x37) return known("Power", "J/h", n3);
            if (vif <= 0x3F) return known("Volume Flow", "m³/h", n3 - 6);
            if (vif <= 0x47) return known("Volume Flow", "m³/min", n3 - 7);
            if (vif <= 0x4F) return known("Volume Flow", "m³/s", n3 - 9);
            if (vif <= 0x57) return known("Mass Flow", "kg/h", n3 - 3);
            if (vif <= 0x5B) return known("Flow Temperature", "°C", n2 - 3);
            if (vif <= 0x5F) return known("Return Temperature", "°C", n2 - 3);
            if (vif <= 0x63) return known("Temperature Difference", "K", n2 - 3);
            if (vif <= 0x67) return known("External Temperature", "°C", n2 - 3);
            if (vif <= 0x6B) return known("Pressure", "bar", n2 - 3);
            if (vif == 0x6C) return known("Date", "", 0, ValueKind::Date);
            if (vif == 0x6D) return known("Time Point", "", 0, ValueKind::DateTime);
            if (vif == 0x6E) return known("HCA", "", 0);
            if (vif >= 0x70 && vif <= 0x73) return timeSpan("Averaging Duration", static_cast<uint8_t>(n2));
            if (vif >= 0x74 && vif <= 0x77) return timeSpan("Actuality Duration", static_cast<uint8_t>(n2));
            if (vif == 0x78) return known("Fabrication No", "", 0, ValueKind::Identifier);
            if (vif == 0x79) return known("Enhanced Identification", "", 0, ValueKind::Identifier);
            if (vif == 0x7A) return known("Bus Address", "", 0);
            return {};
        }

        // VIF 0xFD
        VifInfo extensionFD(const uint8_t raw_vife) {
            const uint8_t e = raw_vife & 0x7F;
            const int n4 = e & 0x0F;

            switch (e) {
                case 0x08: return known("Access Number", "", 0);
                case 0x09: return known("Medium", "", 0);
                case 0x0C: return known("Model Version", "", 0, ValueKind::Identifier);
                case 0x0D: return known("Hardware Version", "", 0, ValueKind::Identifier);
                case 0x0E: return known("Firmware Version", "", 0, ValueKind::Identifier);
                case 0x0F: return known("Software Version", "", 0, ValueKind::Identifier);
                case 0x17: return known("Error Flags", "", 0, ValueKind::Identifier);
                case 0x1A: return known("Digital Output", "", 0, ValueKind::Identifier);
                case 0x1B: return known("Digital Input", "", 0, ValueKind::Identifier);
                default: break;
            }
            if (e >= 0x40 && e <= 0x4F) return known("Voltage", "V", n4 - 9);
            if (e >= 0x50 && e <= 0x5F) return known("Current", "A", n4 - 12);
            return {};
        }

        // VIF 0xFB
        VifInfo extensionFB(const uint8_t raw_vife) {
            const uint8_t e = raw_vife & 0x7F;
            const int n1 = e & 0x01;
            const int n2 = e & 0x03;

            if (e <= 0x01) return known("Energy", "kWh", n1 + 2);       // MWh * 10^(n-1)
            if (e >= 0x08 && e <= 0x09) return known("Energy", "GJ", n1 - 1);
            if (e >= 0x10 && e <= 0x11) return known("Volume", "m³", n1 + 2);
            if (e >= 0x18 && e <= 0x19) return known("Mass", "t", n1 + 2);
            if (e >= 0x28 && e <= 0x29) return known("Power", "W", n1 + 5);  // MW * 10^(n-1)
            if (e >= 0x74 && e <= 0x77) return known("Temperature Limit", "°C", n2 - 3);
            return {};
        }

        class Cursor {
            public:
                explicit Cursor(const std::span<const uint8_t> data) : m_data(data) {}

                [[nodiscard]] bool atEnd() const { return m_pos >= m_data.size(); }
                [[nodiscard]] size_t remaining() const { return m_data.size() - m_pos; }

                std::optional<uint8_t> next() {
                    if (atEnd()) return std::nullopt;
                    return m_data[m_pos++];
                }

                std::optional<std::span<const uint8_t>> take(const size_t n) {
                    if (remaining() < n) return std::nullopt;
                    auto out = m_data.subspan(m_pos, n);
                    m_pos += n;
                    return out;
                }

            private:
                std::span<const uint8_t> m_data;
                size_t m_pos{0};
        };

        int64_t decodeInteger(const std::span<const uint8_t> bytes) {
            uint64_t raw = 0;
            for (size_t i = 0; i < bytes.size(); ++i) {
                raw |= static_cast<uint64_t>(bytes[i]) << (8 * i);
            }
            if (bytes.size() < 8 && !bytes.empty() && (bytes.back() & 0x80)) {
                raw |= ~uint64_t{0} << (8 * bytes.size());
            }
            return static_cast<int64_t>(raw);
        }

        // nullopt если встречены не-BCD полубайты
        std::optional<int64_t> decodeBcd(const std::span<const uint8_t> bytes) {
            int64_t value = 0;
            bool negative = false;
            for (size_t i = bytes.size(); i-- > 0;) {
                uint8_t hi = bytes[i] >> 4;
                const uint8_t lo = bytes[i] & 0x0F;
                if (i == bytes.size() - 1 && hi == 0x0F) {
                    negative = true;
                    hi = 0;
                }
                if (hi > 9 || lo > 9) return std::nullopt;
                value = value * 100 + hi * 10 + lo;
            }
            return negative ? -value : value;
        }

        std::string bytesToHex(const std::span<const uint8_t> bytes) {
            std::string out;
            for (size_t i = bytes.size(); i-- > 0;) {
                out += utils::stringFormat("%02X", bytes[i]);
            }
            return out;
        }

        std::string reversedAscii(const std::span<const uint8_t> bytes) {
            std::string out;
            out.reserve(bytes.size());
            for (size_t i = bytes.size(); i-- > 0;) {
                const auto c = static_cast<char>(bytes[i]);
                if (std::isprint(static_cast<unsigned char>(c))) out.push_back(c);
            }
            return out;
        }

        std::string formatTypeG(const std::span<const uint8_t> b) {
            const int day = b[0] & 0x1F;
            const int month = b[1] & 0x0F;
            int year = ((b[0] & 0xE0) >> 5) | ((b[1] & 0xF0) >> 1);
            year += (year < 81) ? 2000 : 1900;
            return utils::stringFormat("%04d-%02d-%02d", year, month, day);
        }

        std::string formatTypeF(const std::span<const uint8_t> b) {
            const int minute = b[0] & 0x3F;
            const int hour = b[1] & 0x1F;
            const int day = b[2] & 0x1F;
            const int month = b[3] & 0x0F;
            int year = ((b[2] & 0xE0) >> 5) | ((b[3] & 0xF0) >> 1);
            year += (year < 81) ? 2000 : 1900;
            return utils::stringFormat("%04d-%02d-%02d %02d:%02d", year, month, day, hour, minute);
        }

        std::string recordBaseName(const VifInfo& info, const common::FunctionField fn, const uint32_t storage, const uint32_t tariff) {
            std::string base = info.quantity;
            switch (fn) {
                case common::FunctionField::Maximum:          base += " Max"; break;
                case common::FunctionField::Minimum:          base += " Min"; break;
                case common::FunctionField::ValueDuringError: base += " Error"; break;
                default: break;
            }
            if (tariff > 0) base += utils::stringFormat(" Tariff %u", tariff);
            if (storage > 0) base += utils::stringFormat(" Storage %u", storage);
            return base;
        }
    }

    std::optional<VariableDataHeader> decodeHeader(const std::span<const uint8_t> data) {
        if (data.size() < VariableHeaderLength) {
            return std::nullopt;
        }
        VariableDataHeader header;
        header.identification = utils::stringFormat("%02X%02X%02X%02X", data[3], data[2], data[1], data[0]);
        header.manufacturer_code = static_cast<uint16_t>(data[4] | (data[5] << 8));
        header.version = data[6];
        header.medium = data[7];
        header.access_no = data[8];
        header.status = data[9];
        return header;
    }

    std::vector<uint8_t> encodeHeader(const VariableDataHeader& header) {
        std::vector<uint8_t> out(VariableHeaderLength, 0);
        const auto id = Frames::encodeSecondaryMask(header.identification + "FFFFFFFF");
        if (id) {
            std::copy_n(id->begin(), 4, out.begin());
        }
        out[4] = static_cast<uint8_t>(header.manufacturer_code & 0xFF);
        out[5] = static_cast<uint8_t>(header.manufacturer_code >> 8);
        out[6] = header.version;
        out[7] = header.medium;
        out[8] = header.access_no;
        out[9] = header.status;
        return out;
    }

    std::string secondaryAddress(const VariableDataHeader& header) {
        return header.identification + utils::stringFormat("%04X%02X%02X", header.manufacturer_code, header.version, header.medium);
    }

    std::string manufacturerToString(const uint16_t code) {
        const std::array<char, 3> letters = {
            static_cast<char>(((code >> 10) & 0x1F) + 64),
            static_cast<char>(((code >> 5) & 0x1F) + 64),
            static_cast<char>((code & 0x1F) + 64)
        };
        if (std::ranges::all_of(letters, [](const char c) { return c >= 'A' && c <= 'Z'; })) {
            return {letters.begin(), letters.end()};
        }
        return utils::stringFormat("0x%04X", code);
    }

    const char* mediumToString(const uint8_t medium) {
        switch (medium) {
            case 0x00: return "Other";
            case 0x01: return "Oil";
            case 0x02: return "Electricity";
            case 0x03: return "Gas";
            case 0x04: return "Heat (outlet)";
            case 0x05: return "Steam";
            case 0x06: return "Hot water";
            case 0x07: return "Water";
            case 0x08: return "Heat cost allocator";
            case 0x09: return "Compressed air";
            case 0x0A: return "Cooling (outlet)";
            case 0x0B: return "Cooling (inlet)";
            case 0x0C: return "Heat (inlet)";
            case 0x0D: return "Heat / Cooling";
            case 0x0E: return "Bus / System";
            case 0x15: return "Hot water";
            case 0x16: return "Cold water";
            case 0x17: return "Dual water";
            case 0x18: return "Pressure";
            case 0x19: return "A/D converter";
            default:   return "Unknown";
        }
    }

    std::optional<VariableData> decode(const Frames::LongFrame& frame) {
        if (!common::isRspUd(frame.control)) {
            MBUS_LOGD(TAG, "Unexpected control field 0x%02X", frame.control);
            return std::nullopt;
        }
        if (frame.control_info != static_cast<uint8_t>(common::ControlInfo::VariableResponse)) {
            MBUS_LOGD(TAG, "Unsupported CI field 0x%02X", frame.control_info);
            return std::nullopt;
        }

        auto header = decodeHeader(frame.data);
        if (!header) {
            MBUS_LOGD(TAG, "Variable data header truncated (%zu bytes)", frame.data.size());
            return std::nullopt;
        }

        VariableData result;
        result.header = *header;

        Cursor cursor(std::span<const uint8_t>(frame.data).subspan(VariableHeaderLength));
        std::set<std::string> used_names;
        size_t index = 0;

        while (!cursor.atEnd()) {
            const uint8_t dif = *cursor.next();
            if (dif == 0x2F) continue;                 // Filler
            if (dif == 0x0F || dif == 0x1F) break;     // Manufacturer specific data follows

            const auto fn = static_cast<common::FunctionField>((dif >> 4) & 0x03);
            uint32_t storage = (dif >> 6) & 0x01;
            uint32_t tariff = 0;

            uint8_t prev = dif;
            for (int k = 0; prev & 0x80; ++k) {
                const auto dife = cursor.next();
                if (!dife || k >= 10) return std::nullopt;
                storage |= static_cast<uint32_t>(*dife & 0x0F) << (1 + 4 * k);
                tariff |= static_cast<uint32_t>((*dife >> 4) & 0x03) << (2 * k);
                prev = *dife;
            }

            const auto vif = cursor.next();
            if (!vif) return std::nullopt;

            std::vector<uint8_t> vifes;
            prev = *vif;
            while (prev & 0x80) {
                const auto vife = cursor.next();
                if (!vife || vifes.size() >= 10) return std::nullopt;
                vifes.push_back(*vife);
                prev = *vife;
            }

            VifInfo info;
            const uint8_t vif_code = *vif & 0x7F;
            if (*vif == 0xFD && !vifes.empty()) {
                info = extensionFD(vifes.front());
            } else if (*vif == 0xFB && !vifes.empty()) {
                info = extensionFB(vifes.front());
            } else if (vif_code == 0x7C) {
                const auto text_len = cursor.next();
                if (!text_len) return std::nullopt;
                const auto text = cursor.take(*text_len);
                if (!text) return std::nullopt;
                info.unit = reversedAscii(*text);
            } else {
                info = primaryVif(*vif);
            }

            RecordValue value{0.0};
            bool has_value = true;
            bool corrupt = false;
            const uint8_t data_field = dif & 0x0F;

            auto numeric = [&info](const double raw) -> RecordValue {
                return std::round(raw * std::pow(10.0, info.exponent) * 10000.0) / 10000.0;
            };

            switch (data_field) {
                case 0x00:
                case 0x08:
                    has_value = false;
                    break;
                case 0x01: case 0x02: case 0x03: case 0x04: case 0x06: case 0x07: {
                    static constexpr std::array<size_t, 8> lengths = {0, 1, 2, 3, 4, 0, 6, 8};
                    const auto bytes = cursor.take(lengths[data_field]);
                    if (!bytes) return std::nullopt;
                    if (info.kind == ValueKind::Date && bytes->size() == 2) {
                        value = formatTypeG(*bytes);
                    } else if (info.kind == ValueKind::DateTime && bytes->size() == 4) {
                        value = formatTypeF(*bytes);
                    } else if (info.kind == ValueKind::Identifier) {
                        value = std::to_string(decodeInteger(*bytes));
                    } else {
                        value = numeric(static_cast<double>(decodeInteger(*bytes)));
                    }
                    break;
                }
                case 0x05: {
                    const auto bytes = cursor.take(4);
                    if (!bytes) return std::nullopt;
                    const uint32_t raw = static_cast<uint32_t>(decodeInteger(*bytes));
                    float f = 0.0f;
                    std::memcpy(&f, &raw, sizeof(f));
                    value = numeric(static_cast<double>(f));
                    break;
                }
                case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0E: {
                    const size_t len = (data_field == 0x0E) ? 6 : static_cast<size_t>(data_field - 0x08);
                    const auto bytes = cursor.take(len);
                    if (!bytes) return std::nullopt;
                    const auto bcd = decodeBcd(*bytes);
                    if (!bcd && info.kind == ValueKind::Identifier) {
                        value = bytesToHex(*bytes);
                    } else if (!bcd) {
                        // Числовое поле не меняет тип: запись пропускается до следующего чтения
                        corrupt = true;
                    } else if (info.kind == ValueKind::Identifier) {
                        value = utils::stringFormat("%0*lld", static_cast<int>(len * 2), static_cast<long long>(*bcd));
                    } else {
                        value = numeric(static_cast<double>(*bcd));
                    }
                    break;
                }
                case 0x0D: {
                    const auto lvar = cursor.next();
                    if (!lvar) return std::nullopt;
                    if (*lvar < 0xC0) {
                        const auto text = cursor.take(*lvar);
                        if (!text) return std::nullopt;
                        value = reversedAscii(*text);
                    } else if (*lvar <= 0xC9 || (*lvar >= 0xD0 && *lvar <= 0xD9)) {
                        const auto bytes = cursor.take(*lvar & 0x0F);
                        if (!bytes) return std::nullopt;
                        const auto bcd = decodeBcd(*bytes);
                        if (!bcd) return std::nullopt;
                        value = numeric(static_cast<double>(*lvar >= 0xD0 ? -*bcd : *bcd));
                    } else if (*lvar >= 0xE0 && *lvar <= 0xEF) {
                        const auto bytes = cursor.take(*lvar - 0xE0);
                        if (!bytes) return std::nullopt;
                        value = bytesToHex(*bytes);
                    } else {
                        MBUS_LOGD(TAG, "Unsupported LVAR 0x%02X", *lvar);
                        return std::nullopt;
                    }
                    break;
                }
                default:
                    return std::nullopt;
            }

            if (!has_value) continue;
            ++index;
            if (corrupt) {
                MBUS_LOGW(TAG, "Record %zu carries invalid BCD digits, skipped", index);
                continue;
            }

            std::string name;
            if (info.generic) {
                name = info.unit.empty()
                    ? utils::stringFormat("Counter %zu", index)
                    : utils::stringFormat("Value %zu (%s)", index, info.unit.c_str());
            } else {
                const std::string base = recordBaseName(info, fn, storage, tariff);
                name = info.unit.empty() ? base : utils::stringFormat("%s (%s)", base.c_str(), info.unit.c_str());
            }
            if (used_names.contains(name)) {
                name += utils::stringFormat(" %zu", index);
            }
            used_names.insert(name);

            result.records.push_back(MBusRecord{
                std::move(name),
                std::move(value),
                info.unit,
                common::functionFieldToString(fn)
            });
        }

        return result;
    }
}
