#include "report.hpp"
#include <sstream>

std::string favourite_to_string(const FavouriteRecord &f)
{
    std::stringstream ss;
    ss << f.name << " (last: " << format_timestamp(f.last_seen) << ") is at (IP: "
       << f.address << ", MAC: " << f.hw_address << ')';
    return ss.str();
}

std::string event_to_string(const ReconcileEvent &e)
{
    std::stringstream ss;

    switch (e.state) {
    case MATCH_NONE:
        ss << "X " << e.name << " (last: " << format_timestamp(e.last_seen) << ") offline";
        break;
    case MATCH_MAC_MOVED:
        ss << "X " << e.name << " (last: " << format_timestamp(e.last_seen)
           << ") not online or MAC changed, IP " << e.address << " has MAC " << e.observed_hw_address
           << ", entry not updated";
        break;
    case MATCH_IP_MOVED:
        ss << "! " << e.name << " (last: " << format_timestamp(e.last_seen)
           << ") IP changed, MAC " << e.hw_address << " has IP " << e.observed_address;
        break;
    case MATCH_CONFLICT:
        ss << "! " << e.name << " (last: " << format_timestamp(e.last_seen)
           << ") conflict, IP " << e.address << " has MAC " << e.observed_hw_address
           << " and MAC " << e.hw_address << " has IP " << e.observed_address;
        break;
    case MATCH_EXACT:
        ss << "! " << e.name << " (last: " << format_timestamp(e.last_seen) << ") online (IP: "
           << e.address << ", MAC: " << e.hw_address << ')';
        if (e.recovered)
            ss << ", found on second try";
        break;
    }

    return ss.str();
}

std::string html_escape(const std::string &s)
{
    std::string out;
    out.reserve(s.length());
    for (char c : s) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        default:
            out += c;
            break;
        }
    }

    return out;
}
