#include "storage/local_object_storage.hpp"

#include "util/logger.hpp"
#include "util/url_codec.hpp"

#include <string_view>
#include <utility>

namespace zipline {

namespace {

// Splits "bucket/key" (after the scheme and host are gone) and checks every segment.
Result SplitBucketKey(std::string_view path, std::string& bucket, std::string& key) {
    while (!path.empty() && path.front() == '/') path.remove_prefix(1);

    const auto slash = path.find('/');
    if (slash == std::string_view::npos || slash == 0 || slash + 1 >= path.size()) {
        return Result::Fail(ErrorCode::InvalidArgument,
                            "storage reference needs bucket and key: '" + std::string(path) + "'");
    }
    bucket.assign(path.substr(0, slash));
    key.assign(path.substr(slash + 1));

    std::string_view rest = path;
    while (!rest.empty()) {
        const auto pos = rest.find('/');
        const auto seg = rest.substr(0, pos);
        if (seg == "..") {
            return Result::Fail(ErrorCode::InvalidArgument,
                                "storage reference escapes root: '" + std::string(path) + "'");
        }
        if (pos == std::string_view::npos) break;
        rest.remove_prefix(pos + 1);
    }
    if (path.find('\\') != std::string_view::npos || path.find('\0') != std::string_view::npos) {
        return Result::Fail(ErrorCode::InvalidArgument,
                            "invalid character in storage reference: '" + std::string(path) + "'");
    }
    return Result::Ok();
}

} // namespace

LocalObjectStorage::LocalObjectStorage(std::string root) : root_(std::move(root)) {
    while (root_.size() > 1 && root_.back() == '/') root_.pop_back();
    if (root_.empty()) root_ = ".";
}

Result LocalObjectStorage::ResolvePath(const std::string& storage_ref, std::string& out_path) const {
    std::string_view ref = storage_ref;
    std::string decoded;

    const auto scheme = ref.find("://");
    if (scheme != std::string_view::npos) {
        const auto scheme_name = ref.substr(0, scheme);
        std::string_view after = ref.substr(scheme + 3);
        after = after.substr(0, after.find_first_of("?#"));

        if (scheme_name == "s3") {
            // s3://bucket/key: the authority is the bucket.
        } else if (scheme_name == "http" || scheme_name == "https") {
            const auto path_start = after.find('/');
            if (path_start == std::string_view::npos) {
                return Result::Fail(ErrorCode::InvalidArgument, "object URL has no path: " + storage_ref);
            }
            after.remove_prefix(path_start);
        } else {
            return Result::Fail(ErrorCode::InvalidArgument,
                                "unsupported storage scheme '" + std::string(scheme_name) + "'");
        }

        auto dec = PercentDecode(after);
        if (!dec) return Result::Fail(ErrorCode::InvalidArgument, "bad escape in object URL: " + storage_ref);
        decoded = std::move(*dec);
        ref = decoded;
    }

    std::string bucket;
    std::string key;
    auto r = SplitBucketKey(ref, bucket, key);
    if (!r.is_ok()) return r;

    out_path = root_ + "/" + bucket + "/" + key;
    return Result::Ok();
}

Result LocalObjectStorage::OpenReadStream(const std::string& storage_ref,
                                          std::chrono::steady_clock::time_point deadline,
                                          std::unique_ptr<IObjectStream>& out) {
    out.reset();

    if (std::chrono::steady_clock::now() >= deadline) {
        return Result::Fail(ErrorCode::UpstreamObjectError, "deadline passed before open: " + storage_ref);
    }

    std::string path;
    auto r = ResolvePath(storage_ref, path);
    if (!r.is_ok()) return Result::Fail(ErrorCode::UpstreamObjectError, r.message());

    auto stream = std::make_unique<LocalObjectStream>();
    r = FileReader::Open(path, stream->reader_);
    if (!r.is_ok()) return Result::Fail(ErrorCode::UpstreamObjectError, r.message());

    LogDebug("opened %s (%llu bytes)", path.c_str(),
             static_cast<unsigned long long>(stream->TotalSize().value_or(0)));
    out = std::move(stream);
    return Result::Ok();
}

} // namespace zipline
