#ifndef MBUSMQTT_STRINGUTILS_HXX
#define MBUSMQTT_STRINGUTILS_HXX

namespace mbusMQTT::utils {
    inline std::string stringFormat(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

    inline std::string stringFormat(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);

        va_list args_copy;
        va_copy(args_copy, args);
        const int len = vsnprintf(nullptr, 0, fmt, args_copy);
        va_end(args_copy);

        if (len < 0) {
            va_end(args);
            return {};
        }

        std::vector<char> buf(len + 1);
        vsnprintf(buf.data(), len + 1, fmt, args);
        va_end(args);

        return {buf.data(), static_cast<size_t>(len)};
    }

    inline std::string toLower(std::string_view in) {
        std::string out(in);
        std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    inline std::string toUpper(std::string_view in) {
        std::string out(in);
        std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }

    /**
     * @brief Lowercase, every non [a-z0-9] byte becomes '_', runs of '_' collapse,
     * leading and trailing '_' are dropped. "Energy (kWh)" -> "energy_kwh".
     */
    inline std::string sanitizeId(std::string_view in) {
        std::string out;
        out.reserve(in.size());
        bool pending_sep = false;
        for (const unsigned char c : in) {
            if (std::isalnum(c) && c < 0x80) {
                if (pending_sep && !out.empty()) {
                    out.push_back('_');
                }
                pending_sep = false;
                out.push_back(static_cast<char>(std::tolower(c)));
            } else {
                pending_sep = true;
            }
        }
        return out;
    }

    // Число с точностью до 4 знаков, без хвостовых нулей
    inline std::string formatNumber(const double value) {
        if (!std::isfinite(value)) {
            return "0";
        }
        std::string out = stringFormat("%.4f", std::round(value * 10000.0) / 10000.0);
        if (const auto dot = out.find('.'); dot != std::string::npos) {
            while (!out.empty() && out.back() == '0') out.pop_back();
            if (!out.empty() && out.back() == '.') out.pop_back();
        }
        if (out == "-0") out = "0";
        return out;
    }

    inline bool isHexString(std::string_view in) {
        return !in.empty() && std::ranges::all_of(in, [](unsigned char c) { return std::isxdigit(c) != 0; });
    }

    inline bool isDecimalString(std::string_view in) {
        return !in.empty() && std::ranges::all_of(in, [](unsigned char c) { return std::isdigit(c) != 0; });
    }
}

#endif //MBUSMQTT_STRINGUTILS_HXX
