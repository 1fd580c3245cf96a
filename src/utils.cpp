#include "utils.hpp"
#include <openssl/evp.h>
#include <array>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext make_sha256_context(){
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if(ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) ctx.reset();
    return ctx;
}

std::optional<std::string> finish_digest(EVP_MD_CTX* ctx){
    std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) return std::nullopt;
    digest.resize(length);
    return hex_from_bytes(digest);
}

}

std::string sha256_hex(const std::string &data){
    auto ctx = make_sha256_context();
    if(!ctx || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) return {};
    return finish_digest(ctx.get()).value_or(std::string());
}

std::optional<std::string> sha256_file_hex(const std::filesystem::path& file){
    std::ifstream in(file, std::ios::binary);
    if(!in) return std::nullopt;

    auto ctx = make_sha256_context();
    if(!ctx) return std::nullopt;

    std::vector<char> buffer(1024 * 1024);
    while(in){
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize read = in.gcount();
        if(read > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(read)) != 1){
            return std::nullopt;
        }
    }
    if(in.bad()) return std::nullopt;
    return finish_digest(ctx.get());
}

std::string format_size(uint64_t bytes){
    if(bytes < 1024) return std::to_string(bytes) + "B";

    static const char* suffixes[] = {"B", "K", "M", "G", "T", "P"};
    constexpr std::size_t suffix_count = sizeof(suffixes) / sizeof(suffixes[0]);
    double value = static_cast<double>(bytes);
    size_t idx = 0;
    while(idx + 1 < suffix_count && value >= 1024.0){
        value /= 1024.0;
        ++idx;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(value >= 100 ? 0 : (value >= 10 ? 1 : 2)) << value;
    std::string out = oss.str();
    if(out.find('.') != std::string::npos){
        while(!out.empty() && out.back() == '0') out.pop_back();
        if(!out.empty() && out.back() == '.') out.pop_back();
    }
    return out + suffixes[idx];
}

std::string format_duration_compact(std::chrono::steady_clock::duration elapsed){
    double value = std::chrono::duration<double>(elapsed).count();
    char unit = 's';
    if(value >= 60.0){
        value /= 60.0;
        unit = 'm';
        if(value >= 60.0){
            value /= 60.0;
            unit = 'h';
            if(value >= 24.0){
                value /= 24.0;
                unit = 'd';
            }
        }
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(value >= 10.0 ? 0 : 1) << value << unit;
    return oss.str();
}

std::string utc_timestamp_now(){
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string sanitize_file_name(const std::string& name){
    std::string out;
    out.reserve(name.size());
    for(unsigned char c : name){
        if(std::isalnum(c) || c == '.' || c == '_' || c == '-' || c == ' ') out.push_back(static_cast<char>(c));
    }
    // never produce "", "." or ".."
    if(out.empty() || out == "." || out == "..") out = "download" + out;
    return out;
}

std::string shell_quote(const std::string& value){
    std::string out = "'";
    for(char c : value){
        if(c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}
