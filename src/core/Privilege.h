// Linux capability helpers (best-effort; compile-time gated on libcap)
#pragma once
namespace lan_scan {
// Clears every capability set; keep_net_raw retains CAP_NET_RAW.
void drop_capabilities(bool keep_net_raw);
bool is_privilege_available();
}
