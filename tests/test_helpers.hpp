#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "command.hpp"
#include "http_client.hpp"

namespace lempctl_test {

namespace fs = std::filesystem;

inline Lempctl::CommandResult ok(const std::string& output = "")
{
    Lempctl::CommandResult result;
    result.status = Lempctl::CommandStatus::Succeeded;
    result.exitCode = 0;
    result.output = output;
    return result;
}

inline Lempctl::CommandResult failed(int exitCode = 1, const std::string& output = "")
{
    Lempctl::CommandResult result;
    result.status = Lempctl::CommandStatus::Failed;
    result.exitCode = exitCode;
    result.output = output;
    return result;
}

inline Lempctl::CommandResult notFound()
{
    Lempctl::CommandResult result;
    result.status = Lempctl::CommandStatus::NotFound;
    return result;
}

/**
 * Scripted CommandRunner. Rules are matched against the joined command line;
 * the most recently added matching rule wins, unmatched commands succeed
 * with empty output. Every call is recorded.
 */
class FakeCommandRunner : public Lempctl::CommandRunner
{
public:
    using Handler = std::function<Lempctl::CommandResult(const Lempctl::Command&)>;

    void onPrefix(const std::string& prefix, Handler handler)
    {
        rules_.push_back({prefix, false, std::move(handler)});
    }

    void onPrefix(const std::string& prefix, const Lempctl::CommandResult& result)
    {
        onPrefix(prefix, [result](const Lempctl::Command&) { return result; });
    }

    void onExact(const std::string& line, Handler handler)
    {
        rules_.push_back({line, true, std::move(handler)});
    }

    void onExact(const std::string& line, const Lempctl::CommandResult& result)
    {
        onExact(line, [result](const Lempctl::Command&) { return result; });
    }

    Lempctl::CommandResult run(const Lempctl::Command& command) override
    {
        calls.push_back(command);
        const std::string line = Lempctl::commandLine(command.argv);

        for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
            bool matches = it->exact ? (line == it->pattern) : (line.rfind(it->pattern, 0) == 0);
            if (matches) {
                return it->handler(command);
            }
        }
        return ok();
    }

    std::vector<std::string> lines() const
    {
        std::vector<std::string> out;
        for (const auto& call : calls) {
            out.push_back(Lempctl::commandLine(call.argv));
        }
        return out;
    }

    size_t count(const std::string& prefix) const
    {
        size_t n = 0;
        for (const auto& line : lines()) {
            if (line.rfind(prefix, 0) == 0) {
                ++n;
            }
        }
        return n;
    }

    // Index of the first call starting with prefix, or -1.
    int indexOf(const std::string& prefix) const
    {
        auto all = lines();
        for (size_t i = 0; i < all.size(); ++i) {
            if (all[i].rfind(prefix, 0) == 0) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    std::vector<Lempctl::Command> calls;

private:
    struct Rule
    {
        std::string pattern;
        bool exact;
        Handler handler;
    };
    std::vector<Rule> rules_;
};

inline Lempctl::HttpResponse httpBody(const std::string& body, long status = 200)
{
    Lempctl::HttpResponse response;
    response.ok = true;
    response.statusCode = status;
    response.body = body;
    return response;
}

inline Lempctl::HttpResponse httpError(const std::string& error = "Couldn't connect to server")
{
    Lempctl::HttpResponse response;
    response.error = error;
    return response;
}

/**
 * Scripted HttpClient keyed by exact URL. Unknown URLs fail to connect.
 */
class FakeHttpClient : public Lempctl::HttpClient
{
public:
    using Handler = std::function<Lempctl::HttpResponse(const std::string&)>;

    void on(const std::string& url, Handler handler) { handlers_[url] = std::move(handler); }

    void on(const std::string& url, const Lempctl::HttpResponse& response)
    {
        handlers_[url] = [response](const std::string&) { return response; };
    }

    Lempctl::HttpResponse get(const std::string& url) override
    {
        requests.push_back(url);
        auto it = handlers_.find(url);
        if (it == handlers_.end()) {
            return httpError();
        }
        return it->second(url);
    }

    std::vector<std::string> requests;

private:
    std::map<std::string, Handler> handlers_;
};

/**
 * Creates a fresh directory under the system temp dir and removes it
 * (recursively) on destruction.
 */
class TempDir
{
public:
    TempDir()
    {
        std::string pattern = (fs::temp_directory_path() / "lempctl-test-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (!mkdtemp(buffer.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = buffer.data();
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

    fs::path makeDir(const std::string& name) const
    {
        fs::path dir = path_ / name;
        fs::create_directories(dir);
        return dir;
    }

private:
    fs::path path_;
};

inline std::string readFile(const std::string& path)
{
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline void writeFile(const std::string& path, const std::string& content)
{
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

} // namespace lempctl_test

#endif // TEST_HELPERS_HPP
