#ifndef CALCMCP_STDIO_TRANSPORT_HPP
#define CALCMCP_STDIO_TRANSPORT_HPP

#include <iosfwd>
#include <string>
#include <calcmcp/mcp_server.hpp>

namespace calcmcp {

// Newline-delimited JSON-RPC over a pair of streams. Strictly sequential:
// responses are written in the order the requests were read.
class StdioTransport {
public:
    explicit StdioTransport(const MCPServer& server);

    // Returns 0 at end of input. Throws std::runtime_error if the input
    // stream reports a read error.
    int run(std::istream& in, std::ostream& out);

    // Answer a single line. Returns an empty string for blank lines.
    std::string handle_line(const std::string& line) const;

private:
    const MCPServer& server_;
};

} // namespace calcmcp

#endif // CALCMCP_STDIO_TRANSPORT_HPP
