// ============================================================
// network_operation.cpp
// ============================================================

#include "network_operation.hpp"
#include "file_encryptor.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <sstream>

// key=value&key=value with both sides percent-encoded, in container order
template <typename Pairs>
static std::string form_encode(const Pairs& params) {
    std::string out;
    for (auto& kv : params) {
        if (!out.empty()) out += '&';
        out += utils::url_encode(kv.first);
        out += '=';
        out += utils::url_encode(kv.second);
    }
    return out;
}

// ---------------------------------------------------------------
// Identity
// ---------------------------------------------------------------

std::string NetworkOperation::canonical_url(const std::string& url, ParamList& query_out) {
    std::string u = url;

    auto frag = u.find('#');
    if (frag != std::string::npos) u.erase(frag);

    auto qpos = u.find('?');
    if (qpos != std::string::npos) {
        std::string query = u.substr(qpos + 1);
        u.erase(qpos);
        for (const auto& piece : utils::split(query, '&')) {
            if (piece.empty()) continue;
            auto eq = piece.find('=');
            std::string k = utils::url_decode(piece.substr(0, eq));
            std::string v = eq == std::string::npos ? "" : utils::url_decode(piece.substr(eq + 1));
            query_out.emplace_back(std::move(k), std::move(v));
        }
    }

    auto scheme_end = u.find("://");
    if (scheme_end == std::string::npos) return u;

    std::string scheme = utils::to_lower(u.substr(0, scheme_end));
    std::string rest   = u.substr(scheme_end + 3);
    auto slash = rest.find('/');
    std::string authority = utils::to_lower(rest.substr(0, slash));
    std::string path      = slash == std::string::npos ? "/" : rest.substr(slash);

    auto strip_suffix = [&authority](const std::string& sfx) {
        if (authority.size() > sfx.size() &&
            authority.compare(authority.size() - sfx.size(), sfx.size(), sfx) == 0) {
            authority.erase(authority.size() - sfx.size());
        }
    };
    if (scheme == "http")  strip_suffix(":80");
    if (scheme == "https") strip_suffix(":443");

    return scheme + "://" + authority + path;
}

std::string NetworkOperation::compute_fingerprint(HttpMethod method, const std::string& url,
                                                  const Params& params)
{
    ParamList all;
    std::string canon = canonical_url(url, all);
    all.insert(all.end(), params.begin(), params.end());
    std::sort(all.begin(), all.end());
    std::string text = std::string(method_name(method)) + "\n" + canon + "\n" + form_encode(all);
    return hash::fingerprint(text);
}

NetworkOperation::NetworkOperation(HttpMethod method, std::string url, Params params, bool use_ssl)
    : method_(method)
    , url_(std::move(url))
    , params_(std::move(params))
    , use_ssl_(use_ssl)
    , fingerprint_(compute_fingerprint(method_, url_, params_))
{
}

// ---------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------

void NetworkOperation::set_tag(const std::string& tag) {
    std::lock_guard<std::mutex> lk(mutex_);
    tag_ = tag;
}

std::string NetworkOperation::tag() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return tag_;
}

void NetworkOperation::set_timeout_ms(u32 ms) {
    std::lock_guard<std::mutex> lk(mutex_);
    timeout_ms_ = ms;
}

u32 NetworkOperation::timeout_ms() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return timeout_ms_;
}

void NetworkOperation::set_retry_policy(const RetryPolicy& p) {
    std::lock_guard<std::mutex> lk(mutex_);
    retry_ = p;
}

RetryPolicy NetworkOperation::retry_policy() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return retry_;
}

void NetworkOperation::set_cache_policy(CachePolicy p) {
    std::lock_guard<std::mutex> lk(mutex_);
    cache_policy_ = p;
}

CachePolicy NetworkOperation::cache_policy() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return cache_policy_;
}

void NetworkOperation::set_requires_access_token(bool v) {
    std::lock_guard<std::mutex> lk(mutex_);
    requires_access_token_ = v;
}

bool NetworkOperation::requires_access_token() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return requires_access_token_;
}

void NetworkOperation::set_encrypt_downloaded_file(bool v) {
    std::lock_guard<std::mutex> lk(mutex_);
    encrypt_downloaded_file_ = v;
}

bool NetworkOperation::encrypt_downloaded_file() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return encrypt_downloaded_file_;
}

void NetworkOperation::set_download_destination(const std::string& path) {
    std::lock_guard<std::mutex> lk(mutex_);
    download_destination_ = path;
}

std::string NetworkOperation::download_destination() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return download_destination_;
}

void NetworkOperation::set_local_test_data_path(const std::string& path) {
    std::lock_guard<std::mutex> lk(mutex_);
    local_test_data_path_ = path;
}

std::string NetworkOperation::local_test_data_path() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return local_test_data_path_;
}

void NetworkOperation::set_priority(OperationPriority p) {
    std::lock_guard<std::mutex> lk(mutex_);
    priority_ = p;
}

OperationPriority NetworkOperation::priority() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return priority_;
}

void NetworkOperation::set_expected_download_size(u64 bytes) {
    std::lock_guard<std::mutex> lk(mutex_);
    expected_download_size_ = bytes;
}

u64 NetworkOperation::expected_download_size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return expected_download_size_;
}

void NetworkOperation::set_header_value(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (value.empty()) {
        headers_.erase(key);
    } else {
        headers_[key] = value;
    }
}

Headers NetworkOperation::custom_headers() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return headers_;
}

void NetworkOperation::set_body_encoder(BodyEncoder encoder, const std::string& content_type) {
    std::lock_guard<std::mutex> lk(mutex_);
    body_encoder_      = std::move(encoder);
    body_content_type_ = content_type;
}

void NetworkOperation::add_file_part(FilePart part) {
    std::lock_guard<std::mutex> lk(mutex_);
    files_.push_back(std::move(part));
}

void NetworkOperation::add_file(const std::string& path, const std::string& param_name,
                                const std::string& mime_type)
{
    FilePart part;
    part.data       = file_io::read_small_file(path);
    part.param_name = param_name;
    part.file_name  = std::filesystem::path(path).filename().string();
    part.mime_type  = mime_type;
    add_file_part(std::move(part));
}

// ---------------------------------------------------------------
// Callback registration
// ---------------------------------------------------------------

void NetworkOperation::add_completion_handler(CompletionCallback on_complete, ErrorCallback on_error) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (on_complete) callbacks_.completions.push_back(std::move(on_complete));
    if (on_error)    callbacks_.errors.push_back(std::move(on_error));
}

void NetworkOperation::add_cancel_handler(CancelCallback on_cancel) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (on_cancel) callbacks_.cancels.push_back(std::move(on_cancel));
}

void NetworkOperation::add_upload_progress_handler(ProgressCallback cb) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (cb) upload_progress_.push_back(std::move(cb));
}

void NetworkOperation::add_download_progress_handler(ProgressCallback cb) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (cb) download_progress_.push_back(std::move(cb));
}

void NetworkOperation::add_observer(std::weak_ptr<OperationObserver> observer) {
    std::lock_guard<std::mutex> lk(mutex_);
    callbacks_.observers.push_back(std::move(observer));
}

// ---------------------------------------------------------------
// Runtime state
// ---------------------------------------------------------------

OperationState NetworkOperation::state() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

u32 NetworkOperation::retry_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return retries_;
}

int NetworkOperation::status_code() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return status_code_;
}

Headers NetworkOperation::response_headers() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return response_headers_;
}

std::optional<NetworkError> NetworkOperation::error() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return error_;
}

std::optional<std::vector<u8>> NetworkOperation::response_data() const {
    std::string path;
    std::shared_ptr<FileEncryptor> encryptor;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!is_terminal(state_)) return std::nullopt;
        if (stored_file_.empty()) return body_;
        path      = stored_file_;
        encryptor = file_encryptor_;
    }

    try {
        std::vector<u8> data = file_io::read_small_file(path);
        if (encryptor) data = encryptor->decrypt(data);
        return data;
    } catch (const std::exception& e) {
        LOG_WARN("response_data: cannot load " + path + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<std::string> NetworkOperation::response_string() const {
    auto data = response_data();
    if (!data) return std::nullopt;
    return std::string(data->begin(), data->end());
}

std::optional<Json::Value> NetworkOperation::response_json() const {
    auto text = response_string();
    if (!text || text->empty()) return std::nullopt;

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(text->data(), text->data() + text->size(), &root, &errs)) {
        return std::nullopt;
    }
    return root;
}

// ---------------------------------------------------------------
// Request rendering
// ---------------------------------------------------------------

std::string NetworkOperation::request_url() const {
    if (!params_in_query(method_) || params_.empty()) return url_;
    char sep = url_.find('?') == std::string::npos ? '?' : '&';
    return url_ + sep + form_encode(params_);
}

std::string NetworkOperation::build_multipart(const std::string& boundary) const {
    std::ostringstream out;
    for (auto& kv : params_) {
        out << "--" << boundary << "\r\n"
            << "Content-Disposition: form-data; name=\"" << kv.first << "\"\r\n\r\n"
            << kv.second << "\r\n";
    }
    for (auto& f : files_) {
        out << "--" << boundary << "\r\n"
            << "Content-Disposition: form-data; ";
        if (!f.param_name.empty()) out << "name=\"" << f.param_name << "\"; ";
        out << "filename=\"" << f.file_name << "\"\r\n"
            << "Content-Type: "
            << (f.mime_type.empty() ? "application/octet-stream" : f.mime_type) << "\r\n\r\n";
        out.write((const char*)f.data.data(), (std::streamsize)f.data.size());
        out << "\r\n";
    }
    out << "--" << boundary << "--\r\n";
    return out.str();
}

std::string NetworkOperation::encoded_body(std::string& content_type) const {
    std::lock_guard<std::mutex> lk(mutex_);
    content_type.clear();
    if (params_in_query(method_)) return "";

    if (!files_.empty()) {
        std::string boundary = "netqueue-" + fingerprint_;
        content_type = "multipart/form-data; boundary=" + boundary;
        return build_multipart(boundary);
    }
    if (body_encoder_) {
        content_type = body_content_type_;
        return body_encoder_(params_);
    }
    if (params_.empty()) return "";
    content_type = "application/x-www-form-urlencoded; charset=utf-8";
    return form_encode(params_);
}

// ---------------------------------------------------------------
// Engine-only transitions
// ---------------------------------------------------------------

u64 NetworkOperation::begin_execution(u64 now_ms) {
    std::lock_guard<std::mutex> lk(mutex_);
    state_ = OperationState::EXECUTING;
    ++attempt_;
    admitted_ms_ = now_ms;
    if (first_admitted_ms_ == 0) first_admitted_ms_ = now_ms;
    status_code_ = 0;
    response_headers_.clear();
    body_.clear();
    error_.reset();
    return attempt_;
}

void NetworkOperation::return_to_pending(bool count_retry) {
    std::lock_guard<std::mutex> lk(mutex_);
    state_ = OperationState::PENDING;
    if (count_retry) ++retries_;
    status_code_ = 0;
    response_headers_.clear();
    body_.clear();
    error_.reset();
}

void NetworkOperation::store_response(const TransportResult& result) {
    std::lock_guard<std::mutex> lk(mutex_);
    status_code_      = result.http_status;
    response_headers_ = result.headers;
    body_             = result.body;
}

void NetworkOperation::store_downloaded_file(const std::string& path,
                                             std::shared_ptr<FileEncryptor> encryptor)
{
    std::lock_guard<std::mutex> lk(mutex_);
    stored_file_    = path;
    file_encryptor_ = std::move(encryptor);
    body_.clear();
}

NetworkOperation::CallbackSet NetworkOperation::finish(OperationState terminal,
                                                       std::optional<NetworkError> err)
{
    std::lock_guard<std::mutex> lk(mutex_);
    state_ = terminal;
    error_ = std::move(err);
    CallbackSet out = std::move(callbacks_);
    callbacks_ = CallbackSet{};
    upload_progress_.clear();
    download_progress_.clear();
    return out;
}

void NetworkOperation::adopt_handlers_from(NetworkOperation& other) {
    if (&other == this) return;
    std::scoped_lock lk(mutex_, other.mutex_);
    auto append = [](auto& dst, auto& src) {
        for (auto& x : src) dst.push_back(std::move(x));
        src.clear();
    };
    append(callbacks_.completions, other.callbacks_.completions);
    append(callbacks_.errors,      other.callbacks_.errors);
    append(callbacks_.cancels,     other.callbacks_.cancels);
    append(callbacks_.observers,   other.callbacks_.observers);
    append(upload_progress_,       other.upload_progress_);
    append(download_progress_,     other.download_progress_);
}

bool NetworkOperation::is_current_attempt(u64 attempt) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return state_ == OperationState::EXECUTING && attempt_ == attempt;
}

bool NetworkOperation::retry_allowed(u64 now_ms, u64 unlimited_ceiling_ms) const {
    std::lock_guard<std::mutex> lk(mutex_);
    u64 elapsed = now_ms > first_admitted_ms_ ? now_ms - first_admitted_ms_ : 0;
    return retry_.allows_retry(retries_, elapsed, unlimited_ceiling_ms);
}

u64 NetworkOperation::admitted_ms() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return admitted_ms_;
}

void NetworkOperation::notify_progress(ProgressDirection dir, u64 done, u64 total) {
    std::vector<ProgressCallback> cbs;
    double fraction = 0.0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (state_ != OperationState::EXECUTING) return;
        if (total == 0 && dir == ProgressDirection::DOWNLOAD) total = expected_download_size_;
        if (total == 0) return;
        fraction = std::min(1.0, (double)done / (double)total);
        cbs = dir == ProgressDirection::UPLOAD ? upload_progress_ : download_progress_;
    }
    for (auto& cb : cbs) {
        try {
            cb(fraction);
        } catch (const std::exception& e) {
            LOG_ERROR("Progress handler threw for " + url_ + ": " + e.what());
        }
    }
}
