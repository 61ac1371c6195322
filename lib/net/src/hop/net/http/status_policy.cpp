// C++ Standard Library
#include <string>

// GSL
#include <gsl/gsl>

// Project
#include <hop/net/http/error.hpp>
#include <hop/net/http/status_policy.hpp>

namespace hop::net
{

    bool StatusPolicy::apply(BodyStream& body, int status, std::string_view final_uri) const
    {
        if (!is_valid_status(status))
        {
            body.close();
            throw HttpError{ errc::invalid_status, "invalid HTTP status code " + std::to_string(status) };
        }

        if (status >= 400)
        {
            if (status == failure.value_or(k_default_failure))
            {
                body.close();
                return false;
            }

            std::string content;
            {
                auto closer = gsl::finally([&body] { body.close(); });
                content = read_string(body, k_status_error_excerpt);
            }
            throw StatusError{ status, std::move(content), std::string{ final_uri } };
        }

        if (classify_status(status) != StatusClass::success)
        {
            body.close();
            throw HttpError{ errc::unexpected_status,
                             "status " + std::to_string(status) + " reached the status policy unresolved" };
        }

        // A 2xx other than the declared success code is still a success.
        return true;
    }

} // namespace hop::net
