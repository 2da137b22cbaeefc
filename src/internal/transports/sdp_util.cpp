#include "internal/transports/sdp_util.hpp"
#include "internal/core/util/random.hpp"

#include <charconv>
#include <sstream>

namespace ktnsync::sdp {

    namespace {
        std::optional<std::string> lineWithPrefix(const std::string& text, const std::string& prefix) {
            std::istringstream in(text);
            std::string line;
            while (std::getline(in, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (line.compare(0, prefix.size(), prefix) == 0) return line.substr(prefix.size());
            }
            return std::nullopt;
        }

        template <typename T>
        bool parseNumber(const std::string& s, T& out) {
            if (s.empty()) return false;
            auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
            return ec == std::errc{} && p == s.data() + s.size();
        }
    }

    std::string newSessionId() {
        std::array<uint8_t, 16> tok{};
        randomFill(tok);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v = (v << 8) | tok[i];
        return std::to_string(v & 0x7fffffffffffffffULL);
    }

    std::string buildDescription(const std::string& sessionId, SignalKind kind,
                                 const std::string& transportProto, const std::string& extraAttrs) {
        std::string d;
        d += "v=0\r\n";
        d += "o=- " + sessionId + " 2 IN IP4 127.0.0.1\r\n";
        d += "s=-\r\n";
        d += "t=0 0\r\n";
        d += "a=group:BUNDLE 0\r\n";
        d += "m=application 9 " + transportProto + " webrtc-datachannel\r\n";
        d += "c=IN IP4 0.0.0.0\r\n";
        d += "a=mid:0\r\n";
        d += kind == SignalKind::Offer ? "a=setup:actpass\r\n" : "a=setup:active\r\n";
        d += extraAttrs;
        return d;
    }

    std::optional<std::string> sessionId(const std::string& description) {
        if (description.compare(0, 4, "v=0") != 0) return std::nullopt;
        auto origin = lineWithPrefix(description, "o=");
        if (!origin) return std::nullopt;

        // o=<username> <sess-id> <sess-version> IN IP4 <address>
        std::istringstream in(*origin);
        std::string user, id;
        if (!(in >> user >> id)) return std::nullopt;
        uint64_t numeric = 0;
        if (!parseNumber(id, numeric)) return std::nullopt;
        return id;
    }

    std::optional<std::string> attribute(const std::string& description, const std::string& name) {
        return lineWithPrefix(description, "a=" + name + ":");
    }

    std::string formatCandidate(const Candidate& c) {
        std::string s = "candidate:" + c.foundation + " " + std::to_string(c.component) + " " +
                        c.transport + " " + std::to_string(c.priority) + " " + c.address + " " +
                        std::to_string(c.port) + " typ " + c.type;
        if (!c.tcpType.empty()) s += " tcptype " + c.tcpType;
        return s;
    }

    std::optional<Candidate> parseCandidate(const std::string& line) {
        static const std::string kPrefix = "candidate:";
        if (line.compare(0, kPrefix.size(), kPrefix) != 0) return std::nullopt;

        std::istringstream in(line.substr(kPrefix.size()));
        Candidate c;
        std::string component, priority, port, typ;
        if (!(in >> c.foundation >> component >> c.transport >> priority >> c.address >> port >> typ >> c.type))
            return std::nullopt;
        if (typ != "typ") return std::nullopt;
        if (!parseNumber(component, c.component) || !parseNumber(priority, c.priority) ||
            !parseNumber(port, c.port))
            return std::nullopt;

        std::string key, value;
        while (in >> key >> value) {
            if (key == "tcptype") c.tcpType = value;
        }
        return c;
    }

    uint32_t hostPriority(uint32_t localPreference, int component) {
        // RFC 8445 5.1.2.1 with type preference 126 for host candidates.
        return (126u << 24) + ((localPreference & 0xffffu) << 8) + static_cast<uint32_t>(256 - component);
    }

}
