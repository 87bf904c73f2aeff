#pragma once
#include <yyjson.h>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "capabilities.hpp"
#include "errors.hpp"
#include "key_classifier.hpp"
#include "number.hpp"
#include "reader_concept.hpp"
#include "writer_concept.hpp"

namespace ScalarFusion {

// Owns an immutable yyjson document read from text.
class YyjsonDocument {
public:
    static YyjsonDocument read(std::string_view text) {
        yyjson_read_flag flags = YYJSON_READ_NOFLAG;
        if constexpr (arbitrary_precision_enabled()) {
            flags |= YYJSON_READ_NUMBER_AS_RAW;
        }
        yyjson_read_err err{};
        // yyjson does not write to the input unless YYJSON_READ_INSITU is set
        yyjson_doc* doc = yyjson_read_opts(const_cast<char*>(text.data()), text.size(), flags, nullptr, &err);
        return YyjsonDocument(doc, err.pos);
    }

    YyjsonDocument(YyjsonDocument&& other) noexcept
        : doc_(std::exchange(other.doc_, nullptr))
        , error_pos_(other.error_pos_)
    {}
    YyjsonDocument& operator=(YyjsonDocument&& other) noexcept {
        if (this != &other) {
            yyjson_doc_free(doc_);
            doc_ = std::exchange(other.doc_, nullptr);
            error_pos_ = other.error_pos_;
        }
        return *this;
    }
    YyjsonDocument(const YyjsonDocument&) = delete;
    YyjsonDocument& operator=(const YyjsonDocument&) = delete;

    ~YyjsonDocument() {
        yyjson_doc_free(doc_);
    }

    explicit operator bool() const noexcept { return doc_ != nullptr; }

    yyjson_val* root() const noexcept { return yyjson_doc_get_root(doc_); }

    // Byte offset of a syntax error; meaningful only when reading failed.
    std::size_t error_position() const noexcept { return error_pos_; }

private:
    YyjsonDocument(yyjson_doc* doc, std::size_t error_pos) noexcept
        : doc_(doc), error_pos_(error_pos)
    {}

    yyjson_doc* doc_       = nullptr;
    std::size_t error_pos_ = 0;
};

// Owns a mutable yyjson document being built by YyjsonWriter.
class YyjsonMutDocument {
public:
    YyjsonMutDocument() : doc_(yyjson_mut_doc_new(nullptr)) {}
    YyjsonMutDocument(const YyjsonMutDocument&) = delete;
    YyjsonMutDocument& operator=(const YyjsonMutDocument&) = delete;
    ~YyjsonMutDocument() {
        yyjson_mut_doc_free(doc_);
    }

    yyjson_mut_doc* get() const noexcept { return doc_; }

    bool write(std::string& out) const {
        std::size_t len = 0;
        char* text = yyjson_mut_write(doc_, YYJSON_WRITE_NOFLAG, &len);
        if (!text) {
            return false;
        }
        out.assign(text, len);
        std::free(text);
        return true;
    }

private:
    yyjson_mut_doc* doc_;
};


class YyjsonReader {
public:
    using error_type = ErrorInfo;

    using iterator_type = yyjson_val*; // to satisfy Parser's current() API

    // Per-container state lives here, not in the reader.
    struct ArrayFrame {
        yyjson_val*   arr      = nullptr;
        yyjson_arr_iter it{};
        std::size_t   index    = 0;     // current element index
        std::size_t   size     = 0;     // total elements
        yyjson_val*   current  = nullptr; // current element, or nullptr if empty/done
    };

    struct MapFrame {
        yyjson_val*   obj      = nullptr;
        yyjson_obj_iter it{};
        yyjson_val*   key      = nullptr; // current key node
        yyjson_val*   value    = nullptr; // current value node
    };

    explicit YyjsonReader(yyjson_val* root) noexcept
        : root_(root)
        , current_(root)
    {}

    // ---- Introspection ----

    iterator_type current() const noexcept {
        // For yyjson backend we don't know exact char position; use node ptr.
        return current_;
    }

    error_type getError() const noexcept { return err_; }

    Unexpected unexpected() const noexcept {
        if (!current_) return Unexpected::Other;
        if (yyjson_is_null(current_)) return Unexpected::Unit;
        if (yyjson_is_bool(current_)) return Unexpected::Bool;
        if (yyjson_is_uint(current_)) return Unexpected::Unsigned;
        if (yyjson_is_sint(current_)) return Unexpected::Signed;
        if (yyjson_is_real(current_)) return Unexpected::Float;
        if (yyjson_is_raw(current_)) {
            const number_detail::NumeralShape shape = number_detail::classify_numeral(raw_text());
            if (!shape.integral) return Unexpected::Float;
            return shape.negative ? Unexpected::Signed : Unexpected::Unsigned;
        }
        if (yyjson_is_str(current_)) return Unexpected::Str;
        if (yyjson_is_arr(current_)) return Unexpected::Seq;
        if (yyjson_is_obj(current_)) return Unexpected::Object;
        return Unexpected::Other;
    }

    reader::TryParseStatus peek_kind(reader::ValueKind& kind) {
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
        }
        if (yyjson_is_null(current_))      kind = reader::ValueKind::Null;
        else if (yyjson_is_bool(current_)) kind = reader::ValueKind::Bool;
        else if (yyjson_is_uint(current_)) kind = reader::ValueKind::Unsigned;
        else if (yyjson_is_sint(current_)) kind = reader::ValueKind::Signed;
        else if (yyjson_is_real(current_)) kind = reader::ValueKind::Float;
        else if (yyjson_is_raw(current_))  kind = reader::ValueKind::NumberText;
        else if (yyjson_is_str(current_))  kind = reader::ValueKind::String;
        else if (yyjson_is_arr(current_))  kind = reader::ValueKind::Array;
        else if (yyjson_is_obj(current_))  kind = reader::ValueKind::Object;
        else return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
        return reader::TryParseStatus::ok;
    }

    // ---- Scalars ----

    reader::TryParseStatus start_value_and_try_read_null() {
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
        }
        if (!yyjson_is_null(current_)) {
            return reader::TryParseStatus::no_match;
        }
        return reader::TryParseStatus::ok;
    }

    reader::TryParseStatus read_bool(bool& b) {
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
        }
        if (!yyjson_is_bool(current_)) {
            return reader::TryParseStatus::no_match;
        }
        b = yyjson_get_bool(current_) != 0;
        return reader::TryParseStatus::ok;
    }

    template<class NumberT>
    reader::TryParseStatus read_number(NumberT& storage) {
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
        }
        number_detail::Narrowing r;
        if (yyjson_is_uint(current_)) {
            r = number_detail::narrow_integer(std::uint64_t(yyjson_get_uint(current_)), storage);
        } else if (yyjson_is_sint(current_)) {
            r = number_detail::narrow_integer(std::int64_t(yyjson_get_sint(current_)), storage);
        } else if (yyjson_is_real(current_)) {
            r = number_detail::narrow_double(yyjson_get_real(current_), storage);
        } else if (yyjson_is_raw(current_)) {
            r = number_detail::narrow_text(raw_text(), storage);
        } else {
            return reader::TryParseStatus::no_match;
        }
        if (r != number_detail::Narrowing::ok) {
            return fail_status(number_detail::narrowing_error(r));
        }
        return reader::TryParseStatus::ok;
    }

    // Only raw numbers (arbitrary precision) carry their text.
    reader::TryParseStatus read_number_text(std::string& out) {
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
        }
        if (!yyjson_is_raw(current_)) {
            return reader::TryParseStatus::no_match;
        }
        out.assign(raw_text());
        return reader::TryParseStatus::ok;
    }

    // ---- String reader (for both keys and values) ----
    //
    // Protocol:
    //  - For keys: current_ must point to the key node.
    //  - For values: current_ must point to the value node.
    //  The parser / object frame logic is responsible for setting current_.

    reader::StringChunkResult read_string_chunk(char* out, std::size_t capacity) {
        reader::StringChunkResult res{};
        res.status = reader::StringChunkStatus::error;
        res.bytes_written = 0;
        res.done = false;

        if (capacity == 0) {
            fail(make_error(ValueError::INVALID_STATE, "a non-empty buffer"));
            return res;
        }

        if (!value_str_active_) {
            if (!current_ || !yyjson_is_str(current_)) {
                res.status = reader::StringChunkStatus::no_match;
                return res;
            }

            value_str_data_   = yyjson_get_str(current_);
            value_str_len_    = yyjson_get_len(current_);
            value_str_offset_ = 0;
            value_str_active_ = true;
        }

        const std::size_t remaining = value_str_len_ - value_str_offset_;
        const std::size_t n         = remaining < capacity ? remaining : capacity;

        std::memcpy(out, value_str_data_ + value_str_offset_, n);
        value_str_offset_ += n;

        res.status        = reader::StringChunkStatus::ok;
        res.bytes_written = n;
        res.done          = (value_str_offset_ >= value_str_len_);

        if (res.done) {
            reset_value_string_state();
        }

        return res;
    }

    // A string gives its bytes; an array must hold numbers in 0..255.
    reader::TryParseStatus read_bytes(std::vector<std::byte>& out) {
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
        }
        out.clear();
        if (yyjson_is_str(current_)) {
            const char* data = yyjson_get_str(current_);
            const std::size_t len = yyjson_get_len(current_);
            out.resize(len);
            std::memcpy(out.data(), data, len);
            return reader::TryParseStatus::ok;
        }
        if (!yyjson_is_arr(current_)) {
            return reader::TryParseStatus::no_match;
        }

        yyjson_val* arr = current_;
        yyjson_arr_iter it;
        yyjson_arr_iter_init(arr, &it);
        out.reserve(yyjson_arr_size(arr));
        while (yyjson_val* item = yyjson_arr_iter_next(&it)) {
            current_ = item;
            std::uint8_t byte = 0;
            reader::TryParseStatus st = read_number(byte);
            if (st == reader::TryParseStatus::no_match) {
                fail(invalid_type(unexpected(), "a byte"));
                return reader::TryParseStatus::error;
            } else if (st == reader::TryParseStatus::error) {
                return st;
            }
            out.push_back(std::byte{byte});
        }
        current_ = arr;
        return reader::TryParseStatus::ok;
    }

    reader::TryParseStatus read_raw_value(std::string& out) {
        if constexpr (!raw_value_enabled()) {
            return reader::TryParseStatus::no_match;
        } else {
            if (!current_) {
                return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
            }
            std::size_t len = 0;
            char* text = yyjson_val_write(current_, YYJSON_WRITE_NOFLAG, &len);
            if (!text) {
                return fail_status(make_error(ValueError::ALLOCATION_FAILED));
            }
            out.assign(text, len);
            std::free(text);
            return reader::TryParseStatus::ok;
        }
    }

    // ---- Arrays (new frame-based API) ----

    // Parser: creates ArrayFrame on its stack and calls this.
    reader::IterationStatus read_array_begin(ArrayFrame& frame) {
        reset_value_string_state();

        reader::IterationStatus ret;
        if (!current_){
            fail(make_error(ValueError::INVALID_STATE, "a sequence"));
            ret.status = reader::TryParseStatus::error;
            return ret;
        }

        if(!yyjson_is_arr(current_)) {
            ret.status = reader::TryParseStatus::no_match;
            return ret;
        }

        yyjson_val* arr = current_;
        frame.arr   = arr;
        frame.size  = yyjson_arr_size(arr);
        frame.index = 0;
        frame.current = nullptr;

        if (frame.size > 0) {
            yyjson_arr_iter_init(arr, &frame.it);
            frame.current = yyjson_arr_iter_next(&frame.it);
            current_ = frame.current; // first element
            ret.has_value = true;
        } else {
            // Empty array – keep current_ on the array node.
            current_ = frame.arr;
            ret.has_value = false;
        }
        ret.status = reader::TryParseStatus::ok;

        return ret;
    }

    reader::IterationStatus advance_after_value(ArrayFrame& frame) {
        reset_value_string_state();
        reader::IterationStatus ret;

        if (!frame.arr) {
            fail(make_error(ValueError::INVALID_STATE, "a sequence"));
            ret.status = reader::TryParseStatus::error;
            return ret;
        }

        ++frame.index;
        if (frame.index < frame.size) {
            // Move to next element.
            frame.current = yyjson_arr_iter_next(&frame.it);
            current_ = frame.current;
            ret.has_value = true;
        } else {
            // Last element finished; current_ becomes the array node.
            frame.current = nullptr;
            current_ = frame.arr;
            ret.has_value = false;
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }


    reader::IterationStatus read_map_begin(MapFrame& frame) {
        reset_value_string_state();
        reader::IterationStatus ret;

        if (!current_){
            fail(make_error(ValueError::INVALID_STATE, "a map"));
            ret.status = reader::TryParseStatus::error;
            return ret;
        }
        if(!yyjson_is_obj(current_)) {
            ret.status = reader::TryParseStatus::no_match;
            return ret;
        }

        yyjson_val* obj = current_;
        frame.obj       = obj;
        frame.key       = nullptr;
        frame.value     = nullptr;

        yyjson_obj_iter_init(obj, &frame.it);

        // Preload first member, if any.
        if (!advance_object_member(frame)) {
            current_ = frame.obj;
            ret.has_value = false;
        } else {
            // we have a first key; set current_ to that key for key-string reading.
            current_ = frame.key;
            ret.has_value = true;
        }

        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    // A string is a unit variant; a single-entry object carries a payload
    // under the variant name.
    reader::TryParseStatus read_enum_begin(MapFrame& frame, bool& has_payload) {
        has_payload = false;
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "an enum"));
        }
        if (yyjson_is_str(current_)) {
            return reader::TryParseStatus::ok;
        }
        if (!yyjson_is_obj(current_)) {
            return reader::TryParseStatus::no_match;
        }
        if (yyjson_obj_size(current_) != 1) {
            return fail_status(ErrorInfo{ValueError::INVALID_LENGTH, Unexpected::Object, "map with a single key"});
        }
        has_payload = true;
        return read_map_begin(frame).status;
    }

    // Parser: after it finishes reading the key string, it calls this
    // to switch from key → value context.
    bool move_to_value(MapFrame& frame) {
        reset_value_string_state();

        if (!frame.obj) return true;
        if (!frame.value) {
            fail(make_error(ValueError::INVALID_STATE, "a map value"));
            return false;
        }

        current_ = frame.value;
        return true;
    }

    // Parser: after the value is parsed, it calls this to move to the next member.
    reader::IterationStatus advance_after_value(MapFrame& frame) {
        reset_value_string_state();

        reader::IterationStatus ret;

        if (!frame.obj) {
            fail(make_error(ValueError::INVALID_STATE, "a map"));
            ret.status = reader::TryParseStatus::error;
            return ret;
        }

        // We just finished reading frame.value.
        if (!advance_object_member(frame)) {
            // No more members → we're effectively at '}'.
            current_ = frame.obj;
            ret.has_value = false;
        } else {
            // Moved to next key.
            current_ = frame.key;
            ret.has_value = true;
        }
        ret.status = reader::TryParseStatus::ok;

        return ret;
    }

    // ---- Skip support ----

    bool skip_value() {
        // DOM is already built; for yyjson, "skip" means "don't materialize".
        return true;
    }

    bool finish() {
        return true;
    }

private:
    yyjson_val* root_    = nullptr;
    yyjson_val* current_ = nullptr;
    ErrorInfo   err_{};

    void fail(ErrorInfo e) noexcept {
        if (err_.code == ValueError::NO_ERROR) err_ = e;
    }

    reader::TryParseStatus fail_status(ErrorInfo e) noexcept {
        fail(e);
        return reader::TryParseStatus::error;
    }

    std::string_view raw_text() const noexcept {
        return std::string_view(yyjson_get_raw(current_), yyjson_get_len(current_));
    }

    // --- String chunk state for *value at current_* (keys or values) ---
    const char* value_str_data_   = nullptr;
    std::size_t value_str_len_    = 0;
    std::size_t value_str_offset_ = 0;
    bool        value_str_active_ = false;

    void reset_value_string_state() noexcept {
        value_str_data_   = nullptr;
        value_str_len_    = 0;
        value_str_offset_ = 0;
        value_str_active_ = false;
    }

    // Advance object iterator to next member.
    // On success:
    //   - frame.key / frame.value updated
    //   - returns true
    // On end:
    //   - frame.key = frame.value = nullptr
    //   - returns false
    bool advance_object_member(MapFrame& frame) {
        if (!frame.obj) return false;

        yyjson_val* key = yyjson_obj_iter_next(&frame.it);
        if (!key) {
            frame.key       = nullptr;
            frame.value     = nullptr;
            return false;
        }

        frame.key       = key;
        frame.value     = yyjson_obj_iter_get_val(key);
        return true;
    }
};

static_assert(reader::ReaderLike<YyjsonReader>);


class YyjsonWriter {
public:
    using iterator_type = yyjson_mut_val*;

    using error_type = ErrorInfo;

    struct ArrayFrame {
        yyjson_mut_val* node = nullptr;

        // link to parent "scope" (if any)
        void* parent_frame   = nullptr;
        bool  parent_is_map  = false;
    };

    struct MapFrame {
        yyjson_mut_val* node = nullptr;

        // parent scope
        void* parent_frame   = nullptr;
        bool  parent_is_map  = false;

        // key state
        bool        expecting_key = true;
        std::string pending_key;

        // reserved-name struct: its one field is emitted raw into the parent
        reserved_names::Kind reserved = reserved_names::Kind::Ordinary;
        bool                 received = false;
    };

    explicit YyjsonWriter(yyjson_mut_doc * doc)
        : doc_(doc)
        , root_(nullptr)
        , current_(nullptr)
        , scope_kind_(ScopeKind::Root)
        , scope_frame_(nullptr)
    {
        if (!doc_) {
            error_ = make_error(ValueError::ALLOCATION_FAILED);
        }
    }

    // ========== required API for WriterLike ==========

    iterator_type& current() noexcept {
        return current_;
    }

    error_type getError() const noexcept {
        return error_;
    }

    // ---- containers ----

    bool write_array_begin(std::size_t const& /*size*/, ArrayFrame& frame) {
        if (!ensure_ok()) return false;
        yyjson_mut_val* arr = yyjson_mut_arr(doc_);
        if (!arr) return fail_alloc();

        // Attach array as a value of current scope
        if (!attach_value_to_current(arr)) {
            return false;
        }

        // Fill frame and switch scope to this array
        frame.node         = arr;
        frame.parent_frame = scope_frame_;
        frame.parent_is_map = (scope_kind_ == ScopeKind::Map);

        scope_kind_  = ScopeKind::Array;
        scope_frame_ = &frame;

        current_ = arr;
        return true;
    }

    bool write_map_begin(std::size_t const& /*size*/, MapFrame& frame) {
        if (!ensure_ok()) return false;

        yyjson_mut_val* obj = yyjson_mut_obj(doc_);
        if (!obj) return fail_alloc();

        // Attach map as a value of current scope
        if (!attach_value_to_current(obj)) {
            return false;
        }

        enter_map_scope(obj, frame);
        current_ = obj;
        return true;
    }

    // Ordinary structs are maps. Reserved names open a scope that accepts
    // one field keyed by the same name and writes its text raw.
    bool write_struct_begin(std::string_view name, std::size_t const& size, MapFrame& frame) {
        const reserved_names::Kind kind = classify_struct_name(name);
        if (kind == reserved_names::Kind::Ordinary) {
            return write_map_begin(size, frame);
        }
        if (!ensure_ok()) return false;
        if (scope_kind_ == ScopeKind::Map && static_cast<MapFrame*>(scope_frame_)->expecting_key) {
            return fail_state();
        }
        enter_map_scope(nullptr, frame);
        frame.reserved = kind;
        return true;
    }

    // {"Name": payload}; the payload is the next value written.
    bool write_variant_begin(writer::VariantKind /*kind*/, std::size_t const& /*index*/, std::string_view name, MapFrame& frame) {
        if (!write_map_begin(1, frame)) {
            return false;
        }
        frame.pending_key.assign(name.data(), name.size());
        frame.expecting_key = false;
        return true;
    }

    bool write_variant_end(MapFrame& frame) {
        return write_map_end(frame);
    }

    // “Separator” hook: called *between* elements.
    // For DOM / yyjson this is a no-op; commas are implicit in tree.
    bool advance_after_value(ArrayFrame& ) {
        return ensure_ok();
    }

    bool advance_after_value(MapFrame& ) {
        return ensure_ok();
    }

    // For textual JSON this would emit ':'. For yyjson we just sanity-check.
    bool move_to_value(MapFrame& frame) {
        if (!ensure_ok()) return false;
        if (scope_kind_ != ScopeKind::Map || scope_frame_ != &frame) {
            return fail_state();
        }

        if (frame.expecting_key) {
            // value without key
            return fail_state();
        }
        // nothing to do; next write_* will attach as value for pending key
        return true;
    }

    bool write_array_end(ArrayFrame& frame) {
        if (!ensure_ok()) return false;
        if (scope_kind_ != ScopeKind::Array || scope_frame_ != &frame) {
            return fail_state();
        }

        // restore parent scope from frame
        restore_parent_scope(frame.parent_frame, frame.parent_is_map);
        return true;
    }

    bool write_map_end(MapFrame& frame) {
        if (!ensure_ok()) return false;
        if (scope_kind_ != ScopeKind::Map || scope_frame_ != &frame) {
            return fail_state();
        }

        if (!frame.expecting_key) {
            // have a key without a value
            return fail_state();
        }
        if (frame.reserved != reserved_names::Kind::Ordinary && !frame.received) {
            return fail_state();
        }

        restore_parent_scope(frame.parent_frame, frame.parent_is_map);
        return true;
    }

    // ---- primitives ----

    bool write_null() {
        if (!ensure_ok()) return false;
        yyjson_mut_val* v = yyjson_mut_null(doc_);
        if (!v) return fail_alloc();
        return attach_value_to_current(v);
    }

    bool write_some() {
        return ensure_ok();
    }

    bool write_bool(bool const& b) {
        if (!ensure_ok()) return false;
        yyjson_mut_val* v = yyjson_mut_bool(doc_, b);
        if (!v) return fail_alloc();
        return attach_value_to_current(v);
    }

    template<class NumberT>
    bool write_number(NumberT const& value) {
        if (!ensure_ok()) return false;

        yyjson_mut_val* v = nullptr;
        if constexpr (std::is_floating_point_v<NumberT>) {
            // Same text as float map keys.
            char buf[NUMBER_BUF_SIZE];
            char* end = fp_to_str_detail::format_double_to_chars(buf, buf + sizeof(buf), static_cast<double>(value));
            if (!end) {
                v = yyjson_mut_null(doc_);
            } else {
                v = yyjson_mut_rawncpy(doc_, buf, static_cast<std::size_t>(end - buf));
            }
        } else if constexpr (number_detail::is_wide_v<NumberT>) {
            const std::string text = fp_to_str_detail::integer_to_string(value);
            v = yyjson_mut_rawncpy(doc_, text.data(), text.size());
        } else if constexpr (std::is_signed_v<NumberT>) {
            v = yyjson_mut_sint(doc_, static_cast<int64_t>(value));
        } else if constexpr (std::is_unsigned_v<NumberT>) {
            v = yyjson_mut_uint(doc_, static_cast<uint64_t>(value));
        } else {
            static_assert(std::is_arithmetic_v<NumberT>,
                          "write_number only supports arithmetic types");
        }

        if (!v) return fail_alloc();
        return attach_value_to_current(v);
    }

    // String writing:
    //  - In map & expecting_key → record key in MapFrame
    //  - In a reserved-name struct → the field text, written raw
    //  - Else → create value string node and attach
    bool write_string(char const* data, std::size_t size, bool null_terminated = false) {
        if (!ensure_ok()) return false;

        if (null_terminated) {
            size = std::strlen(data);
        }

        if (scope_kind_ == ScopeKind::Map) {
            MapFrame* frame = static_cast<MapFrame*>(scope_frame_);
            if (frame->expecting_key) {
                frame->pending_key.assign(data, size);
                frame->expecting_key  = false;
                return true;
            }
            if (frame->reserved != reserved_names::Kind::Ordinary) {
                return write_reserved_field(*frame, std::string_view(data, size));
            }
        }

        yyjson_mut_val* v = yyjson_mut_strncpy(doc_, data, size);
        if (!v) return fail_alloc();
        return attach_value_to_current(v);
    }

    bool write_bytes(const std::uint8_t* data, std::size_t size) {
        if (!ensure_ok()) return false;
        yyjson_mut_val* arr = yyjson_mut_arr(doc_);
        if (!arr) return fail_alloc();
        for (std::size_t i = 0; i < size; ++i) {
            if (!yyjson_mut_arr_add_uint(doc_, arr, data[i])) {
                return fail_alloc();
            }
        }
        return attach_value_to_current(arr);
    }

    bool write_unit_variant(std::size_t const& /*index*/, std::string_view name) {
        if (!ensure_ok()) return false;
        yyjson_mut_val* v = yyjson_mut_strncpy(doc_, name.data(), name.size());
        if (!v) return fail_alloc();
        return attach_value_to_current(v);
    }

    // ---- finish ----

    bool finish() {
        if (!ensure_ok()) return false;
        if (!doc_) return fail_state();

        if (!root_) {
            yyjson_mut_val* v = yyjson_mut_null(doc_);
            if (!v) return fail_alloc();
            yyjson_mut_doc_set_root(doc_, v);
            root_ = v;
        }
        return true;
    }


private:
    enum class ScopeKind { Root, Array, Map };

    yyjson_mut_doc* doc_;
    yyjson_mut_val* root_;
    yyjson_mut_val* current_;
    error_type      error_{};

    ScopeKind scope_kind_;
    void*     scope_frame_;

    bool ensure_ok() const noexcept {
        return error_.code == ValueError::NO_ERROR;
    }

    bool fail(ErrorInfo e) {
        if (error_.code == ValueError::NO_ERROR) {
            error_ = e;
        }
        return false;
    }

    bool fail_alloc() {
        return fail(make_error(ValueError::ALLOCATION_FAILED));
    }

    bool fail_state() {
        return fail(make_error(ValueError::INVALID_STATE));
    }

    void enter_map_scope(yyjson_mut_val* obj, MapFrame& frame) {
        frame.node          = obj;
        frame.parent_frame  = scope_frame_;
        frame.parent_is_map = (scope_kind_ == ScopeKind::Map);

        frame.expecting_key = true;
        frame.pending_key.clear();
        frame.reserved      = reserved_names::Kind::Ordinary;
        frame.received      = false;

        scope_kind_  = ScopeKind::Map;
        scope_frame_ = &frame;
    }

    void restore_parent_scope(void* parent_frame, bool parent_is_map) {
        if (!parent_frame) {
            scope_kind_  = ScopeKind::Root;
            scope_frame_ = nullptr;
        } else {
            scope_kind_  = parent_is_map ? ScopeKind::Map : ScopeKind::Array;
            scope_frame_ = parent_frame;
        }
    }

    bool write_reserved_field(MapFrame& frame, std::string_view text) {
        if (frame.received || classify_struct_name(frame.pending_key) != frame.reserved) {
            return fail_state();
        }
        if (frame.reserved == reserved_names::Kind::ReservedRawValue && !YyjsonDocument::read(text)) {
            return fail(make_error(ValueError::INVALID_VALUE, "valid raw wire text"));
        }
        yyjson_mut_val* v = yyjson_mut_rawncpy(doc_, text.data(), text.size());
        if (!v) return fail_alloc();

        const ScopeKind parentKind = !frame.parent_frame ? ScopeKind::Root
                                   : frame.parent_is_map ? ScopeKind::Map
                                                         : ScopeKind::Array;
        if (!attach_value_to(parentKind, frame.parent_frame, v)) {
            return false;
        }
        frame.pending_key.clear();
        frame.expecting_key = true;
        frame.received = true;
        return true;
    }

    bool attach_value_to_current(yyjson_mut_val* v) {
        return attach_value_to(scope_kind_, scope_frame_, v);
    }

    bool attach_value_to(ScopeKind kind, void* scope_frame, yyjson_mut_val* v) {
        if (!ensure_ok()) return false;

        switch (kind) {
        case ScopeKind::Root:
            if (root_) {
                return fail_state(); // multiple roots
            }
            root_ = v;
            yyjson_mut_doc_set_root(doc_, v);
            break;

        case ScopeKind::Array: {
            auto* frame = static_cast<ArrayFrame*>(scope_frame);
            if (!frame || !frame->node) return fail_state();
            if (!yyjson_mut_arr_add_val(frame->node, v)) {
                return fail_alloc();
            }
            break;
        }

        case ScopeKind::Map: {
            auto* frame = static_cast<MapFrame*>(scope_frame);
            if (!frame || !frame->node) return fail_state();
            if (frame->expecting_key) {
                // got a value while still waiting for a key
                return fail_state();
            }

            yyjson_mut_val* key_node = yyjson_mut_strncpy(doc_,
                                                          frame->pending_key.data(),
                                                          frame->pending_key.size());
            frame->pending_key.clear();

            if (!key_node) return fail_alloc();
            if (!yyjson_mut_obj_add(frame->node, key_node, v)) {
                return fail_alloc();
            }
            frame->expecting_key = true;
            break;
        }
        }

        current_ = v;
        return true;
    }
};
static_assert(writer::WriterLike<YyjsonWriter>);
} // namespace ScalarFusion
