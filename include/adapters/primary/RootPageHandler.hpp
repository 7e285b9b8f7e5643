#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include "adapters/primary/HttpUtils.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <iostream>

namespace jellyvr::adapters::primary
{

    /**
     * @brief GET / - страница логина через QuickConnect
     *
     * Cookie jellyvr_session хранит secret текущего запроса QuickConnect.
     * Пока код не подтверждён, страница обновляется каждые 5 секунд.
     * После подтверждения показывает логин и (один раз) пароль для HereSphere.
     *
     * GET /relogin начинает новый QuickConnect даже при активной сессии,
     * после подтверждения выдаётся новый пароль, старая сессия вытесняется.
     */
    class RootPageHandler : public IHttpHandler
    {
    public:
        static constexpr const char *COOKIE_NAME = "jellyvr_session";
        static constexpr int REFRESH_SECONDS = 5;
        static constexpr const char *RELOGIN_PATH = "/relogin";

        explicit RootPageHandler(std::shared_ptr<ports::input::IAuthService> authService)
            : authService_(std::move(authService))
        {
            std::cout << "[RootPageHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                res.setResult(405, "text/plain", "Method not allowed");
                return;
            }

            try
            {
                auto secret = http::cookie(req, COOKIE_NAME);
                auto segments = http::pathSegments(req.getPath());
                bool relogin = segments.size() == 1 && segments[0] == "relogin";

                if (secret && !relogin)
                {
                    auto status = authService_->pollLogin(*secret);
                    switch (status.state)
                    {
                    case ports::input::LoginStatus::State::PENDING:
                        sendPage(res, codeBody(status.displayCode), true);
                        return;
                    case ports::input::LoginStatus::State::ACTIVE:
                        sendPage(res, dashboardBody(status, http::requestHost(req)), false);
                        return;
                    case ports::input::LoginStatus::State::EXPIRED:
                    case ports::input::LoginStatus::State::UNKNOWN:
                        break;
                    }
                }

                auto request = authService_->startLogin(secret);
                res.setHeader("Set-Cookie", std::string(COOKIE_NAME) + "=" + request.secret +
                                                "; Path=/; HttpOnly; SameSite=Lax");
                sendPage(res, codeBody(request.displayCode), true);
            }
            catch (const domain::GatewayError &e)
            {
                std::cerr << "[RootPageHandler] Error: " << e.what() << std::endl;
                res.setHeader("Retry-After", std::to_string(REFRESH_SECONDS));
                res.setResult(503, "text/html; charset=utf-8",
                              page("<h1>Service temporarily unavailable</h1><p>Please retry shortly.</p>", true));
            }
        }

    private:
        std::shared_ptr<ports::input::IAuthService> authService_;

        static std::string page(const std::string &body, bool refresh)
        {
            std::string html = "<!DOCTYPE html><html><head><meta charset=\"utf-8\"><title>JellyVR</title>";
            if (refresh)
            {
                html += "<meta http-equiv=\"refresh\" content=\"" + std::to_string(REFRESH_SECONDS) + ";url=/\">";
            }
            html += "</head><body>" + body + "</body></html>";
            return html;
        }

        static void sendPage(IResponse &res, const std::string &body, bool refresh)
        {
            res.setHeader("Cache-Control", "no-store");
            res.setResult(200, "text/html; charset=utf-8", page(body, refresh));
        }

        static std::string codeBody(const std::string &code)
        {
            return "<h1>Code: " + http::htmlEscape(code) + "</h1>"
                   "<p>Enter this code in Jellyfin under Quick Connect.</p>";
        }

        static std::string dashboardBody(const ports::input::LoginStatus &status, const std::string &host)
        {
            std::string username = status.identity ? status.identity->localUsername : "";
            std::string body = "<h1>User: " + http::htmlEscape(username) + "</h1>";
            if (status.oneTimePassword)
            {
                body += "<h1>Pass: " + http::htmlEscape(*status.oneTimePassword) + "</h1>"
                        "<p>This password is shown only once.</p>";
            }
            else
            {
                body += "<p>Password was shown when the session was created.</p>"
                        "<p><a href=\"" + std::string(RELOGIN_PATH) + "\">Lost it? Log in again</a></p>";
            }
            std::string link = http::htmlEscape(host + "/heresphere");
            body += "<h2><a href=\"" + link + "\">" + link + "</a></h2>";
            return body;
        }
    };

} // namespace jellyvr::adapters::primary
