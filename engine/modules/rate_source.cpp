#include "rate_source.hpp"
#include "precompiled.hpp"
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <nlohmann/json.hpp>

namespace currex::modules
{
    namespace
    {
        namespace beast = boost::beast;
        namespace http = beast::http;
        namespace ssl = boost::asio::ssl;
        using tcp = boost::asio::ip::tcp;

        // Runs the io_context until every pending operation has completed.
        auto complete(boost::asio::io_context& io_context) -> void
        {
            io_context.restart();
            io_context.run();
        }

        template <typename Stream>
        auto round_trip(boost::asio::io_context& io_context, Stream& stream, std::chrono::seconds const timeout,
                        http::request<http::string_body> const& request,
                        http::response<http::string_body>& response) -> beast::error_code
        {
            beast::error_code error;

            beast::get_lowest_layer(stream).expires_after(timeout);
            http::async_write(stream, request,
                              [&error](beast::error_code const& result, size_t const) { error = result; });
            complete(io_context);
            if (error)
            {
                return error;
            }

            beast::flat_buffer buffer;
            beast::get_lowest_layer(stream).expires_after(timeout);
            http::async_read(stream, buffer, response,
                             [&error](beast::error_code const& result, size_t const) { error = result; });
            complete(io_context);
            return error;
        }
    } // namespace

    auto parse_endpoint(std::string_view const url, Endpoint& endpoint) -> bool
    {
        auto const scheme_end = url.find("://");
        if (scheme_end == std::string_view::npos)
        {
            return false;
        }

        Endpoint parsed;
        parsed.scheme = boost::to_lower_copy(std::string(url.substr(0, scheme_end)));
        if (parsed.scheme != "http" && parsed.scheme != "https")
        {
            return false;
        }

        std::string_view authority = url.substr(scheme_end + 3);
        auto const path_begin = authority.find('/');
        if (path_begin != std::string_view::npos)
        {
            parsed.path = std::string(authority.substr(path_begin));
            boost::trim_right_if(parsed.path, boost::is_any_of("/"));
            authority = authority.substr(0, path_begin);
        }

        auto const port_begin = authority.rfind(':');
        if (port_begin != std::string_view::npos)
        {
            parsed.port = std::string(authority.substr(port_begin + 1));
            authority = authority.substr(0, port_begin);
            if (parsed.port.empty() || !boost::all(parsed.port, boost::is_digit()))
            {
                return false;
            }
        }
        else
        {
            parsed.port = parsed.scheme == "https" ? "443" : "80";
        }

        if (authority.empty())
        {
            return false;
        }
        parsed.host = std::string(authority);

        endpoint = std::move(parsed);
        return true;
    }

    auto parse_rates(std::string_view const body, std::string_view const base_currency, RateTable& table)
        -> core::ErrorCode
    {
        try
        {
            auto const document = nlohmann::json::parse(body);
            if (!document.is_object())
            {
                return core::ErrorCode::ParseError;
            }

            // {"success":false,"error":{"code":101,"type":"missing_access_key"}}
            if (auto const success = document.find("success");
                success != document.end() && success->is_boolean() && !success->get<bool>())
            {
                return core::ErrorCode::ParseError;
            }

            auto const base = boost::to_upper_copy(std::string(base_currency));
            if (auto const reported_base = document.find("base");
                reported_base != document.end() &&
                (!reported_base->is_string() || !boost::iequals(reported_base->get<std::string>(), base)))
            {
                return core::ErrorCode::ParseError;
            }

            auto const rates = document.find("rates");
            if (rates == document.end() || !rates->is_object() || rates->empty())
            {
                return core::ErrorCode::ParseError;
            }

            RateTable parsed;
            for (auto const& item : rates->items())
            {
                if (!item.value().is_number())
                {
                    return core::ErrorCode::ParseError;
                }

                double const rate = item.value().get<double>();
                if (!std::isfinite(rate) || rate <= 0.0)
                {
                    return core::ErrorCode::ParseError;
                }
                parsed[boost::to_upper_copy(item.key())] = rate;
            }
            parsed.try_emplace(base, 1.0);

            table = std::move(parsed);
            return core::ErrorCode::Success;
        }
        catch (nlohmann::json::exception const&)
        {
            return core::ErrorCode::ParseError;
        }
    }

    HttpRateSource::HttpRateSource(Endpoint endpoint, std::string_view const access_key,
                                   std::chrono::seconds const timeout,
                                   std::optional<std::filesystem::path> const log_path)
        : m_endpoint(std::move(endpoint)), m_access_key(access_key), m_timeout(timeout),
          m_ssl_context(ssl::context::tls_client)
    {
        core::initialize_logger("rates", log_path);

        m_ssl_context.set_default_verify_paths();
        m_ssl_context.set_verify_mode(ssl::verify_peer);
    }

    HttpRateSource::~HttpRateSource()
    {
        spdlog::drop("rates");
    }

    auto HttpRateSource::request_target(std::string_view const base_currency, std::string_view const symbols) const
        -> std::string
    {
        std::string target = fmt::format("{}/latest?base={}", m_endpoint.path, base_currency);
        if (!symbols.empty())
        {
            target += fmt::format("&symbols={}", symbols);
        }
        if (!m_access_key.empty())
        {
            target += fmt::format("&access_key={}", m_access_key);
        }
        return target;
    }

    auto HttpRateSource::fetch(std::string_view const base_currency, RateTable& table, std::string_view const symbols)
        -> core::ErrorCode
    {
        auto const target = this->request_target(base_currency, symbols);

        spdlog::get("rates")->log(spdlog::level::debug, "Fetching rates from {}://{}:{}{}", m_endpoint.scheme,
                                  m_endpoint.host, m_endpoint.port, m_endpoint.path);

        unsigned status = 0;
        std::string body;
        if (auto const error = this->query(target, status, body))
        {
            spdlog::get("rates")->log(spdlog::level::err, "Rate request to {} failed: {}", m_endpoint.host,
                                      error.message());
            return core::ErrorCode::NetworkError;
        }

        if (status < 200 || status >= 300)
        {
            spdlog::get("rates")->log(spdlog::level::err, "Rate request to {} answered with status {}",
                                      m_endpoint.host, status);
            return core::ErrorCode::NetworkError;
        }

        auto const error_code = parse_rates(body, base_currency, table);
        if (error_code != core::ErrorCode::Success)
        {
            spdlog::get("rates")->log(spdlog::level::err, "Malformed rate response ({} bytes)", body.size());
            spdlog::get("rates")->log(spdlog::level::trace, "Response body: {}", body);
            return error_code;
        }

        spdlog::get("rates")->log(spdlog::level::info, "Fetched {} rates against {}", table.size(), base_currency);
        return core::ErrorCode::Success;
    }

    auto HttpRateSource::query(std::string const& target, unsigned& status, std::string& body)
        -> boost::system::error_code
    {
        boost::asio::io_context io_context;

        // getaddrinfo cannot be interrupted, so resolution is bounded by the system resolver, not m_timeout.
        tcp::resolver::results_type endpoints;
        {
            tcp::resolver resolver(io_context);
            beast::error_code error;
            endpoints = resolver.resolve(m_endpoint.host, m_endpoint.port, error);
            if (error)
            {
                return error;
            }
        }

        http::request<http::string_body> request{http::verb::get, target, 11};
        request.set(http::field::host, m_endpoint.host);
        request.set(http::field::user_agent, "currex");
        request.set(http::field::accept, "application/json");

        http::response<http::string_body> response;
        beast::error_code error;

        if (m_endpoint.scheme == "https")
        {
            beast::ssl_stream<beast::tcp_stream> stream(io_context, m_ssl_context);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), m_endpoint.host.c_str()))
            {
                return beast::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category());
            }
            stream.set_verify_callback(ssl::host_name_verification(m_endpoint.host));

            beast::get_lowest_layer(stream).expires_after(m_timeout);
            beast::get_lowest_layer(stream).async_connect(
                endpoints, [&error](beast::error_code const& result, tcp::endpoint const&) { error = result; });
            complete(io_context);
            if (error)
            {
                return error;
            }

            beast::get_lowest_layer(stream).expires_after(m_timeout);
            stream.async_handshake(ssl::stream_base::client,
                                   [&error](beast::error_code const& result) { error = result; });
            complete(io_context);
            if (error)
            {
                return error;
            }

            error = round_trip(io_context, stream, m_timeout, request, response);
            beast::get_lowest_layer(stream).close();
        }
        else
        {
            beast::tcp_stream stream(io_context);

            stream.expires_after(m_timeout);
            stream.async_connect(endpoints,
                                 [&error](beast::error_code const& result, tcp::endpoint const&) { error = result; });
            complete(io_context);
            if (error)
            {
                return error;
            }

            error = round_trip(io_context, stream, m_timeout, request, response);

            beast::error_code shutdown_error;
            stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_error);
            if (shutdown_error && shutdown_error != beast::errc::not_connected)
            {
                spdlog::get("rates")->log(spdlog::level::trace, "Socket shutdown: {}", shutdown_error.message());
            }
        }

        if (error)
        {
            return error;
        }

        status = response.result_int();
        body = std::move(response.body());
        return {};
    }
} // namespace currex::modules
