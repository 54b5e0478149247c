#include "blobstream/http/multipart.hpp"

#include <cctype>

namespace blobstream::http {

namespace {

constexpr size_t MAX_PART_HEADER_BYTES = 16 * 1024;

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

std::string unquote(std::string_view s) {
    s = trim(s);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return std::string(s);
}

// Split "value; a=b; c=\"d\"" parameters; calls fn(key, value) for each.
template <typename Fn>
void for_each_param(std::string_view header_value, Fn fn) {
    size_t pos = header_value.find(';');
    while (pos != std::string_view::npos) {
        size_t next = pos + 1;
        bool quoted = false;
        while (next < header_value.size() && (quoted || header_value[next] != ';')) {
            if (header_value[next] == '"') quoted = !quoted;
            ++next;
        }
        auto param = header_value.substr(pos + 1, next - pos - 1);
        auto eq = param.find('=');
        if (eq != std::string_view::npos) {
            fn(trim(param.substr(0, eq)), unquote(param.substr(eq + 1)));
        }
        pos = next < header_value.size() ? next : std::string_view::npos;
    }
}

bool parse_part_headers(std::string_view headers, MultipartPart& part) {
    bool has_disposition = false;
    while (!headers.empty()) {
        auto eol = headers.find("\r\n");
        auto line = headers.substr(0, eol);
        headers = (eol == std::string_view::npos) ? std::string_view{} : headers.substr(eol + 2);

        auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        auto key = trim(line.substr(0, colon));
        auto value = trim(line.substr(colon + 1));

        if (iequals(key, "Content-Disposition")) {
            has_disposition = true;
            for_each_param(value, [&](std::string_view k, std::string v) {
                if (iequals(k, "name")) {
                    part.name = std::move(v);
                } else if (iequals(k, "filename")) {
                    part.filename = std::move(v);
                    part.has_filename = true;
                }
            });
        } else if (iequals(key, "Content-Type")) {
            part.content_type = std::string(value);
        }
    }
    return has_disposition;
}

}  // namespace

MultipartReader::MultipartReader(std::string boundary, Callbacks callbacks)
    : separator_("\r\n--" + boundary)
    , callbacks_(std::move(callbacks))
    , pending_("\r\n") {}

std::optional<std::string> MultipartReader::boundary_from(std::string_view content_type) {
    auto semi = content_type.find(';');
    if (!iequals(trim(content_type.substr(0, semi)), "multipart/form-data")) {
        return std::nullopt;
    }
    std::optional<std::string> boundary;
    for_each_param(content_type, [&](std::string_view k, std::string v) {
        if (iequals(k, "boundary") && !v.empty()) boundary = std::move(v);
    });
    return boundary;
}

bool MultipartReader::fail(std::string message) {
    state_ = State::Failed;
    error_ = std::move(message);
    pending_.clear();
    pos_ = 0;
    return false;
}

bool MultipartReader::feed(std::string_view data) {
    if (state_ == State::Failed) return false;
    if (state_ == State::Done) return true;

    pending_.append(data.data(), data.size());
    bool progressed = true;
    while (progressed && state_ != State::Done) {
        progressed = false;
        if (!step(progressed)) return false;
    }

    if (state_ == State::Done) {
        pending_.clear();
    } else {
        pending_.erase(0, pos_);
    }
    pos_ = 0;
    return true;
}

bool MultipartReader::finish() {
    if (state_ == State::Done) return true;
    if (state_ == State::Failed) return false;
    return fail(state_ == State::Preamble ? "multipart boundary not found"
                                          : "unterminated multipart body");
}

// Advance by at most one state transition. Sets `progressed` when input was
// consumed and another step may make progress without more data.
bool MultipartReader::step(bool& progressed) {
    const size_t keep = separator_.size() - 1;

    switch (state_) {
        case State::Preamble: {
            auto p = pending_.find(separator_, pos_);
            if (p == std::string::npos) {
                if (pending_.size() > pos_ + keep) pos_ = pending_.size() - keep;
                return true;
            }
            pos_ = p + separator_.size();
            state_ = State::Delimiter;
            progressed = true;
            return true;
        }

        case State::Delimiter: {
            if (pending_.size() - pos_ < 2) return true;
            if (pending_.compare(pos_, 2, "--") == 0) {
                state_ = State::Done;
                progressed = true;
                return true;
            }
            if (pending_.compare(pos_, 2, "\r\n") == 0) {
                pos_ += 2;
                state_ = State::Headers;
                progressed = true;
                return true;
            }
            if (pending_[pos_] == ' ' || pending_[pos_] == '\t') {
                ++pos_;
                progressed = true;
                return true;
            }
            return fail("malformed multipart delimiter");
        }

        case State::Headers: {
            if (pending_.size() - pos_ < 2) return true;
            if (pending_.compare(pos_, 2, "\r\n") == 0) {
                return fail("multipart part without Content-Disposition");
            }
            auto end = pending_.find("\r\n\r\n", pos_);
            if (end == std::string::npos) {
                if (pending_.size() - pos_ > MAX_PART_HEADER_BYTES) {
                    return fail("multipart part headers too large");
                }
                return true;
            }

            MultipartPart part;
            std::string_view headers(pending_.data() + pos_, end - pos_);
            if (!parse_part_headers(headers, part)) {
                return fail("multipart part without Content-Disposition");
            }
            pos_ = end + 4;
            state_ = State::Body;
            progressed = true;
            if (callbacks_.on_part && !callbacks_.on_part(part)) {
                stopped_ = true;
                return fail("multipart decoding stopped");
            }
            return true;
        }

        case State::Body: {
            auto p = pending_.find(separator_, pos_);
            size_t data_end = p;
            if (p == std::string::npos) {
                if (pending_.size() <= pos_ + keep) return true;
                data_end = pending_.size() - keep;
            }

            if (data_end > pos_ && callbacks_.on_data &&
                !callbacks_.on_data(std::string_view(pending_.data() + pos_, data_end - pos_))) {
                stopped_ = true;
                return fail("multipart decoding stopped");
            }
            pos_ = data_end;
            if (p == std::string::npos) return true;

            pos_ = p + separator_.size();
            state_ = State::Delimiter;
            progressed = true;
            if (callbacks_.on_part_end && !callbacks_.on_part_end()) {
                stopped_ = true;
                return fail("multipart decoding stopped");
            }
            return true;
        }

        case State::Done:
        case State::Failed:
            break;
    }
    return true;
}

}  // namespace blobstream::http
