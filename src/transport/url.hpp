// URL splitting shared by the HTTP transports

#pragma once

#include "mcpcompose/exceptions.hpp"

#include <string>

namespace mcpcompose::transport
{

struct ParsedUrl
{
    std::string scheme; ///< "http" or "https"
    std::string host;
    int port{80};
    std::string path{"/"}; ///< includes leading '/', query preserved

    /// scheme://host:port, the form httplib::Client needs for TLS selection
    std::string base() const
    {
        return scheme + "://" + host + ":" + std::to_string(port);
    }
};

inline ParsedUrl parse_url(const std::string& url)
{
    ParsedUrl out;
    std::string rest = url;

    auto scheme_pos = rest.find("://");
    if (scheme_pos != std::string::npos)
    {
        out.scheme = rest.substr(0, scheme_pos);
        rest = rest.substr(scheme_pos + 3);
    }
    else
    {
        out.scheme = "http";
    }
    if (out.scheme != "http" && out.scheme != "https")
        throw TransportError("Unsupported URL scheme: " + out.scheme +
                             " (only http and https are allowed)");

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos)
        out.path = rest.substr(slash);

    const int default_port = out.scheme == "https" ? 443 : 80;
    auto colon = authority.rfind(':');
    if (colon != std::string::npos)
    {
        out.host = authority.substr(0, colon);
        const std::string port = authority.substr(colon + 1);
        if (port.empty() || port.find_first_not_of("0123456789") != std::string::npos)
            throw TransportError("Invalid port in URL: " + url);
        out.port = std::stoi(port);
    }
    else
    {
        out.host = authority;
        out.port = default_port;
    }
    if (out.host.empty())
        throw TransportError("URL has no host: " + url);
    return out;
}

} // namespace mcpcompose::transport
