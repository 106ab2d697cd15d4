#include "ChromeSession.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>
#include <cerrno>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/wait.h>
#include "../utils/Logger.hpp"

namespace {

size_t AppendToString(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

bool IsIdleEvent(const nlohmann::json& event) {
    if (event.value("method", std::string()) != "Page.lifecycleEvent") return false;
    auto params = event.find("params");
    if (params == event.end()) return false;
    return params->value("name", std::string()) == "networkIdle";
}

}

namespace GateResolve {

ChromeSession::ChromeSession(ChromeOptions options) : options_(std::move(options)) {
    try {
        Launch();
        Deadline setup(std::chrono::seconds(10));
        Call("Page.enable", nlohmann::json::object(), setup);
        Call("Page.setLifecycleEventsEnabled", {{"enabled", true}}, setup);
        if (!options_.user_agent.empty()) {
            Call("Network.setUserAgentOverride", {{"userAgent", options_.user_agent}}, setup);
        }
    } catch (const BrowserError&) {
        Close();
        throw;
    }
}

ChromeSession::~ChromeSession() {
    Close();
}

std::vector<std::string> ChromeSession::BuildArgs() const {
    std::vector<std::string> args;
    args.push_back(options_.executable);
    if (options_.headless)
        args.push_back("--headless=new");
    args.push_back("--remote-debugging-port=0");
    args.push_back("--user-data-dir=" + profile_dir_);
    args.push_back("--no-first-run");
    args.push_back("--no-default-browser-check");
    args.push_back("--disable-extensions");
    args.push_back("--disable-sync");
    args.push_back("--disable-default-apps");
    args.push_back("--disable-background-networking");
    args.push_back("--disable-translate");
    args.push_back("--disable-component-update");
    args.push_back("--disable-gpu");
    args.push_back("--no-sandbox");
    args.push_back("--mute-audio");
    args.push_back("--window-size=1366,768");
    if (!options_.user_agent.empty())
        args.push_back("--user-agent=" + options_.user_agent);
    args.push_back("about:blank");
    return args;
}

void ChromeSession::Launch() {
    std::string tmpl = (std::filesystem::temp_directory_path() / "gate_resolve_chrome_XXXXXX").string();
    std::vector<char> dir(tmpl.begin(), tmpl.end());
    dir.push_back('\0');
    if (!mkdtemp(dir.data())) {
        throw BrowserError(std::string("cannot create browser profile directory: ") + std::strerror(errno));
    }
    profile_dir_ = dir.data();

    std::vector<std::string> args = BuildArgs();
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    pid_ = fork();
    if (pid_ < 0) {
        pid_ = -1;
        throw BrowserError(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid_ == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    // The browser writes "<port>\n<browser ws path>" here once it listens.
    const std::filesystem::path port_file = std::filesystem::path(profile_dir_) / "DevToolsActivePort";
    Deadline launch(options_.launch_timeout);
    int port = 0;
    while (port == 0) {
        int status = 0;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            pid_ = -1;
            throw BrowserError("browser exited during startup: " + options_.executable);
        }
        std::ifstream in(port_file);
        std::string port_line;
        std::string path_line;
        if (in && std::getline(in, port_line) && std::getline(in, path_line)) {
            port = std::atoi(port_line.c_str());
            if (port > 0) break;
        }
        if (!launch.SleepFor(std::chrono::milliseconds(100))) {
            throw BrowserError("browser did not open a debugging port within "
                + std::to_string(options_.launch_timeout.count()) + "ms");
        }
    }

    Connect(OpenPageTarget(port));
    Logger::Log(LogLevel::Info, "Browser session started (pid " + std::to_string(pid_) + ", port " + std::to_string(port) + ")");
}

std::string ChromeSession::OpenPageTarget(int port) {
    CURL* easy = curl_easy_init();
    if (!easy) throw BrowserError("curl_easy_init failed");

    std::string body;
    std::string url = "http://127.0.0.1:" + std::to_string(port) + "/json/new?about:blank";
    curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
    curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, "PUT");
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, AppendToString);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, 5000L);
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
    CURLcode rc = curl_easy_perform(easy);
    curl_easy_cleanup(easy);
    if (rc != CURLE_OK) throw BrowserError(std::string("cannot open page target: ") + curl_easy_strerror(rc));

    auto target = nlohmann::json::parse(body, nullptr, false);
    if (target.is_discarded() || !target.is_object()) throw BrowserError("unexpected /json/new response");
    std::string ws_url = target.value("webSocketDebuggerUrl", std::string());
    if (ws_url.empty()) throw BrowserError("page target has no debugger URL");
    return ws_url;
}

void ChromeSession::Connect(const std::string& ws_url) {
    ws_ = curl_easy_init();
    if (!ws_) throw BrowserError("curl_easy_init failed");
    curl_easy_setopt(ws_, CURLOPT_URL, ws_url.c_str());
    curl_easy_setopt(ws_, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(ws_, CURLOPT_CONNECTTIMEOUT_MS, 5000L);
    curl_easy_setopt(ws_, CURLOPT_NOSIGNAL, 1L);
    CURLcode rc = curl_easy_perform(ws_);
    if (rc != CURLE_OK) {
        throw BrowserError(std::string("DevTools WebSocket connect failed: ") + curl_easy_strerror(rc));
    }
}

void ChromeSession::WaitSocket(bool for_write, std::chrono::milliseconds timeout) {
    curl_socket_t sock = CURL_SOCKET_BAD;
    if (curl_easy_getinfo(ws_, CURLINFO_ACTIVESOCKET, &sock) != CURLE_OK || sock == CURL_SOCKET_BAD) {
        throw BrowserError("DevTools connection lost");
    }
    pollfd pfd{};
    pfd.fd = sock;
    pfd.events = for_write ? POLLOUT : POLLIN;
    poll(&pfd, 1, static_cast<int>(std::max<long long>(timeout.count(), 1)));
}

void ChromeSession::Send(const std::string& text, const Deadline& deadline) {
    size_t offset = 0;
    while (offset < text.size()) {
        size_t sent = 0;
        CURLcode rc = curl_ws_send(ws_, text.data() + offset, text.size() - offset, &sent, 0, CURLWS_TEXT);
        if (rc == CURLE_AGAIN) {
            if (deadline.Expired()) throw BrowserError("timed out sending to the browser");
            WaitSocket(true, std::min(deadline.Remaining(), std::chrono::milliseconds(100)));
            continue;
        }
        if (rc != CURLE_OK) throw BrowserError(std::string("DevTools send failed: ") + curl_easy_strerror(rc));
        offset += sent;
    }
}

std::optional<nlohmann::json> ChromeSession::Receive(Clock::time_point until, const Deadline& deadline) {
    std::string message;
    char buffer[65536];
    while (true) {
        size_t received = 0;
        const struct curl_ws_frame* meta = nullptr;
        CURLcode rc = curl_ws_recv(ws_, buffer, sizeof(buffer), &received, &meta);
        if (rc == CURLE_AGAIN) {
            auto now = Clock::now();
            if (now >= until || deadline.Expired()) return std::nullopt;
            auto slice = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
            WaitSocket(false, std::min({slice, deadline.Remaining(), std::chrono::milliseconds(100)}));
            continue;
        }
        if (rc != CURLE_OK) throw BrowserError(std::string("DevTools receive failed: ") + curl_easy_strerror(rc));
        if (!meta) continue;
        if (meta->flags & CURLWS_CLOSE) throw BrowserError("browser closed the DevTools connection");
        if (meta->flags & (CURLWS_PING | CURLWS_PONG)) continue;
        message.append(buffer, received);
        if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) break;
    }

    auto parsed = nlohmann::json::parse(message, nullptr, false);
    if (parsed.is_discarded()) throw BrowserError("malformed DevTools message");
    return parsed;
}

nlohmann::json ChromeSession::Call(const std::string& method, const nlohmann::json& params, const Deadline& deadline) {
    if (closed_ || !ws_) throw BrowserError("browser session is closed");

    const int id = next_id_++;
    nlohmann::json request = {{"id", id}, {"method", method}, {"params", params}};
    Send(request.dump(), deadline);

    while (true) {
        auto reply = Receive(deadline.At(), deadline);
        if (!reply) throw BrowserError("timed out waiting for " + method);
        if (reply->value("id", -1) == id) {
            auto error = reply->find("error");
            if (error != reply->end()) {
                throw BrowserError(method + " failed: " + error->value("message", std::string("unknown error")));
            }
            return reply->value("result", nlohmann::json::object());
        }
        std::string event = reply->value("method", std::string());
        if (event == "Inspector.detached" || event == "Inspector.targetCrashed") {
            throw BrowserError("page target went away (" + event + ")");
        }
        if (!event.empty()) {
            events_.push_back(std::move(*reply));
            if (events_.size() > 512) events_.pop_front();
        }
    }
}

void ChromeSession::Navigate(const std::string& url, const Deadline& deadline) {
    events_.clear();
    auto result = Call("Page.navigate", {{"url", url}}, deadline);
    std::string error = result.value("errorText", std::string());
    if (!error.empty()) throw BrowserError("navigation to " + url + " failed: " + error);
}

void ChromeSession::WaitForIdle(std::chrono::milliseconds max_wait, const Deadline& deadline) {
    const auto until = Clock::now() + deadline.Clamp(max_wait);
    while (true) {
        for (const auto& event : events_) {
            if (IsIdleEvent(event)) {
                events_.clear();
                return;
            }
        }
        events_.clear();

        auto message = Receive(until, deadline);
        if (!message) break;
        if (message->contains("method")) events_.push_back(std::move(*message));
    }
    if (deadline.Expired()) throw BrowserError("budget ran out while the page was loading");
}

std::string ChromeSession::Evaluate(const std::string& expression, const Deadline& deadline) {
    auto result = Call("Runtime.evaluate",
                       {{"expression", expression}, {"returnByValue", true}, {"awaitPromise", true}},
                       deadline);
    auto exception = result.find("exceptionDetails");
    if (exception != result.end()) {
        throw BrowserError("script threw: " + exception->value("text", std::string("exception")));
    }
    auto remote = result.find("result");
    if (remote == result.end()) return {};
    auto value = remote->find("value");
    if (value == remote->end() || value->is_null()) return {};
    if (value->is_string()) return value->get<std::string>();
    return value->dump();
}

bool ChromeSession::Click(const std::string& selector, const Deadline& deadline) {
    std::string script =
        "(function(){var e=document.querySelector(" + nlohmann::json(selector).dump() + ");"
        "if(!e)return false;e.scrollIntoView({block:'center'});e.click();return true;})()";
    return Evaluate(script, deadline) == "true";
}

std::string ChromeSession::CurrentLocation(const Deadline& deadline) {
    return Evaluate("window.location.href", deadline);
}

std::string ChromeSession::Content(const Deadline& deadline) {
    return Evaluate("document.documentElement ? document.documentElement.outerHTML : ''", deadline);
}

void ChromeSession::Close() {
    if (closed_) return;
    closed_ = true;
    if (ws_) {
        curl_easy_cleanup(ws_);
        ws_ = nullptr;
    }
    if (pid_ > 0) {
        kill(pid_, SIGTERM);
        bool exited = false;
        for (int i = 0; i < 20 && !exited; ++i) {
            if (waitpid(pid_, nullptr, WNOHANG) == pid_) exited = true;
            else std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (!exited) {
            kill(pid_, SIGKILL);
            waitpid(pid_, nullptr, 0);
        }
        pid_ = -1;
    }
    if (!profile_dir_.empty()) {
        std::error_code ec;
        std::filesystem::remove_all(profile_dir_, ec);
        profile_dir_.clear();
    }
}

}
