#pragma once
#include <string>

namespace toolhost {

class Host;

// Command handlers used by the REPL and the one-shot flags in main.cpp.
// Each returns a string result for the caller to print.

std::string cmd_servers(const Host& host);
std::string cmd_tools(const Host& host, const std::string& server_id);
std::string cmd_help();

// These change server state.
std::string cmd_start(Host& host, const std::string& server_id);
std::string cmd_stop(Host& host, const std::string& server_id);
std::string cmd_refresh(Host& host, const std::string& server_id);

// "SERVER TOOL [JSON_ARGS]"
std::string cmd_call(Host& host, const std::string& args);

// Route one "/command args" line. Unknown commands get a hint.
std::string run_command(Host& host, const std::string& line);

} // namespace toolhost
