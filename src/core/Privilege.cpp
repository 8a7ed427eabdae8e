#include "Privilege.h"
#include "Logging.h"
#include <string>
#ifdef LAN_SCAN_HAVE_LIBCAP
#include <sys/capability.h>
#endif

namespace lan_scan {

#ifdef LAN_SCAN_HAVE_LIBCAP
static std::string describe(cap_t caps){
    char* text = cap_to_text(caps, nullptr);
    if(!text) return "<unprintable>";
    std::string out = text;
    cap_free(text);
    return out;
}
#endif

void drop_capabilities(bool keep_net_raw){
#ifdef LAN_SCAN_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if(!caps){ Logger::instance().warn("cap_get_proc failed; capabilities unchanged"); return; }
    Logger::instance().debug("Capabilities before drop: " + describe(caps));

    // CAP_NET_RAW can only be retained if it is currently permitted
    cap_flag_value_t had_net_raw = CAP_CLEAR;
    if(cap_get_flag(caps, CAP_NET_RAW, CAP_PERMITTED, &had_net_raw) != 0) had_net_raw = CAP_CLEAR;
    bool keep = keep_net_raw && had_net_raw == CAP_SET;
    cap_clear(caps);
    if(keep){
        cap_value_t raw = CAP_NET_RAW;
        cap_set_flag(caps, CAP_PERMITTED, 1, &raw, CAP_SET);
        cap_set_flag(caps, CAP_EFFECTIVE, 1, &raw, CAP_SET);
    }
    if(cap_set_proc(caps) != 0){
        Logger::instance().error("cap_set_proc failed; capabilities unchanged");
    } else {
        Logger::instance().info(std::string("Dropped capabilities") + (keep ? " (kept CAP_NET_RAW)" : ""));
        Logger::instance().debug("Capabilities after drop: " + describe(caps));
    }
    cap_free(caps);
#else
    (void)keep_net_raw;
    Logger::instance().info("Capability dropping not available (libcap not compiled in)");
#endif
}

bool is_privilege_available(){
#ifdef LAN_SCAN_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

}
