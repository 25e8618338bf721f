#pragma once
// Captured RM520N replies used across decoder, poller and API tests.

#include "linkstation/decoder.hpp"
#include "linkstation/transport/at_framing.hpp"

#include <map>
#include <string>
#include <vector>

namespace testutil {

namespace cmd = linkstation::decoder::cmd;

inline std::vector<std::string> lines_of(const std::string& reply) {
    return linkstation::transport::split_lines(reply);
}

inline const std::string kServingLte =
    "\r\n+QENG: \"servingcell\",\"NOCONN\",\"LTE\",\"FDD\",262,01,1A2B3C4,123,1300,3,5,5,BE40,-95,-10,-65,12,10,20,45\r\n"
    "\r\nOK\r\n";

inline const std::string kServingNsa =
    "\r\n+QENG: \"servingcell\",\"NOCONN\"\r\n"
    "+QENG: \"LTE\",\"FDD\",262,01,1A2B3C4,123,1300,3,5,5,BE40,-95,-10,-65,12,10,20,45\r\n"
    "+QENG: \"NR5G-NSA\",262,01,500,-88,15,-11,636672,78,10,1\r\n"
    "\r\nOK\r\n";

inline const std::string kServingSa =
    "\r\n+QENG: \"servingcell\",\"NOCONN\",\"NR5G-SA\",\"TDD\",262,01,E3F5A1002,301,3E8,636672,78,10,-85,-11,18,1,40\r\n"
    "\r\nOK\r\n";

inline const std::string kQcainfo =
    "\r\n+QCAINFO: \"PCC\",1300,100,\"LTE BAND 3\",1,123,-95,-10,-65,12\r\n"
    "+QCAINFO: \"SCC\",6300,50,\"LTE BAND 20\",1,301,-100,-12,-70,5\r\n"
    "+QCAINFO: \"SCC\",636672,10,\"NR5G BAND 78\",1,500,-88,-11,-60,15\r\n"
    "\r\nOK\r\n";

inline const std::string kNeighbours =
    "\r\n+QENG: \"neighbourcell intra\",\"LTE\",1300,124,-12,-98,-70,5,30,0,-,-,-\r\n"
    "+QENG: \"neighbourcell inter\",\"LTE\",6300,200,-101,-14,-75,2,20,0,-,-\r\n"
    "+QENG: \"neighbourcell\",\"NR5G\",30,636672,501,-90,-12,10\r\n"
    "+QENG: \"neighbourcell\",\"NR5G\",636672,502,-92,-13,8\r\n"
    "\r\nOK\r\n";

inline const std::string kQtemp =
    "\r\n+QTEMP:\"modem-lte-sub6-pa1\",\"35\"\r\n"
    "+QTEMP:\"modem-ambient-usr\",\"38\"\r\n"
    "+QTEMP:\"modem-mmw0\",\"-273\"\r\n"
    "+QTEMP:\"cpuss-0-usr\",\"47\"\r\n"
    "+QTEMP:\"xo-therm-usr\",\"40\"\r\n"
    "\r\nOK\r\n";

/// A full poll battery for a roaming LTE session on cid 1.
inline std::map<std::string, std::string> lte_battery_replies() {
    return {
        {cmd::kCgreg,     "\r\n+CGREG: 2,1,\"BE40\",\"1A2B3C4\",7\r\n\r\nOK\r\n"},
        {cmd::kCereg,     "\r\n+CEREG: 0,5\r\n\r\nOK\r\n"},
        {cmd::kC5greg,    "\r\n+C5GREG: 0,0\r\n\r\nOK\r\n"},
        {cmd::kQnwinfo,   "\r\n+QNWINFO: \"FDD LTE\",\"26201\",\"LTE BAND 3\",1300\r\n\r\nOK\r\n"},
        {cmd::kCops,      "\r\n+COPS: 0,0,\"Telekom.de\",7\r\n\r\nOK\r\n"},
        {cmd::kQrsrp,     "\r\n+QRSRP: -95,-97,-32768,-32768,LTE\r\n\r\nOK\r\n"},
        {cmd::kQrsrq,     "\r\n+QRSRQ: -10,-11,-32768,-32768,LTE\r\n\r\nOK\r\n"},
        {cmd::kQsinr,     "\r\n+QSINR: 12,11,-32768,-32768,LTE\r\n\r\nOK\r\n"},
        {cmd::kServing,   kServingLte},
        {cmd::kNeighbour, kNeighbours},
        {cmd::kQcainfo,   kQcainfo},
        {cmd::kQtemp,     kQtemp},
        {cmd::kQnetdev,   "\r\n+QNETDEVSTATUS: \"rmnet_data0\",\"up\",\"10.64.1.2\",123456,654321\r\n\r\nOK\r\n"},
        {cmd::kCgdcont,   "\r\n+CGDCONT: 1,\"IPV4V6\",\"internet.telekom\",\"0.0.0.0\",0,0,0,0\r\n"
                          "+CGDCONT: 2,\"IPV4V6\",\"ims\",\"0.0.0.0\",0,0,0,0\r\n\r\nOK\r\n"},
        {cmd::kCgact,     "\r\n+CGACT: 1,1\r\n+CGACT: 2,0\r\n\r\nOK\r\n"},
        {cmd::kCgcontrdp, "\r\n+CGCONTRDP: 1,5,\"internet.telekom\",\"10.64.1.2.255.255.255.0\",\"10.64.1.1\","
                          "\"10.74.210.210\",\"10.74.210.211\"\r\n\r\nOK\r\n"},
        {cmd::kQidnscfg,  "\r\n+QIDNSCFG: 1,\"8.8.8.8\",\"8.8.4.4\"\r\n\r\nOK\r\n"},
    };
}

inline std::map<std::string, std::string> info_replies() {
    return {
        {cmd::kGmi,      "\r\nQuectel\r\n\r\nOK\r\n"},
        {cmd::kCgmm,     "\r\nRM520N-GL\r\n\r\nOK\r\n"},
        {cmd::kGmr,      "\r\nRM520NGLAAR03A03M4G\r\n\r\nOK\r\n"},
        {cmd::kGsn,      "\r\n861234567890123\r\n\r\nOK\r\n"},
        {cmd::kCimi,     "\r\n262011234567890\r\n\r\nOK\r\n"},
        {cmd::kIccid,    "\r\n+ICCID: 89490200001234567890\r\n\r\nOK\r\n"},
        {cmd::kCnum,     "\r\n+CNUM: \"\",\"+491701234567\",145\r\n\r\nOK\r\n"},
        {cmd::kQsimstat, "\r\n+QSIMSTAT: 0,1\r\n\r\nOK\r\n"},
        {cmd::kUsbspeed, "\r\n+QCFG: \"usbspeed\",\"20\"\r\n\r\nOK\r\n"},
    };
}

/// Decoder input built from reply text, as the transport would capture it.
inline linkstation::decoder::ReplyBatch batch_of(const std::map<std::string, std::string>& replies) {
    linkstation::decoder::ReplyBatch b;
    for (const auto& kv : replies) b[kv.first] = lines_of(kv.second);
    return b;
}

} // namespace testutil
