// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#pragma once

// The functionality in this header is neither ABI nor API stable.
// If you need that, use the plain C header.

#include <formpdf.h>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <type_traits>

#if defined(__cpp_exceptions)
#define FORMPDF_ERROR_HAPPENED(error_string) throw PdfException(error_string)
#else
#define FORMPDF_ERROR_HAPPENED(error_string)                                                       \
    fprintf(stderr, "FormPDF error: %s\n", error_string);                                          \
    std::abort()
#endif

#define FORMPDF_CPP_CHECK(funccall)                                                                \
    {                                                                                              \
        auto rc = funccall;                                                                        \
        if(rc != 0) {                                                                              \
            FORMPDF_ERROR_HAPPENED(formpdf_error_message(rc));                                     \
        }                                                                                          \
    }

namespace formpdf {

class PdfException : public std::runtime_error {
public:
    PdfException(const char *msg) : std::runtime_error(msg) {}
};

class Buffer;
class FlattenOptions;

inline Buffer flatten_form(std::string_view pdf_data, const FlattenOptions &opts);

template<typename T>
concept ByteSequence = requires(T a) {
    a.data();
    a.size();
};

struct FormPDFCTypeDeleter {
    template<typename T> void operator()(T *cobj) {
        int32_t rc;
        if constexpr(std::is_same_v<T, FormPDF_DocumentProperties>) {
            rc = formpdf_document_properties_destroy(cobj);
        } else if constexpr(std::is_same_v<T, FormPDF_FlattenOptions>) {
            rc = formpdf_flatten_options_destroy(cobj);
        } else if constexpr(std::is_same_v<T, FormPDF_ObjectStore>) {
            rc = formpdf_object_store_destroy(cobj);
        } else if constexpr(std::is_same_v<T, FormPDF_Buffer>) {
            rc = formpdf_buffer_destroy(cobj);
        } else {
            static_assert(std::is_same_v<T, FormPDF_DocumentProperties>, "Unknown C object type.");
        }
        (void)rc; // Not much we can do about this because destructors should not fail or throw.
    }
};

template<typename T> class FormPDFC {
protected:
    operator T *() { return _d.get(); }
    operator const T *() const { return _d.get(); }

    std::unique_ptr<T, FormPDFCTypeDeleter> _d;
};

class DocumentProperties : public FormPDFC<FormPDF_DocumentProperties> {
public:
    friend class ObjectStore;

    DocumentProperties() {
        FormPDF_DocumentProperties *dp;
        FORMPDF_CPP_CHECK(formpdf_document_properties_new(&dp));
        _d.reset(dp);
    }

    void set_version(FormPDF_Pdf_Version version) {
        FORMPDF_CPP_CHECK(formpdf_document_properties_set_version(*this, version));
    }

    void set_xref_stream(bool use_xref_stream) {
        FORMPDF_CPP_CHECK(formpdf_document_properties_set_xref_stream(*this, use_xref_stream));
    }

    void set_compress_streams(bool compress) {
        FORMPDF_CPP_CHECK(formpdf_document_properties_set_compress_streams(*this, compress));
    }
};

class Buffer : public FormPDFC<FormPDF_Buffer> {
public:
    friend class ObjectStore;
    friend Buffer flatten_form(std::string_view, const FlattenOptions &);

    std::string_view bytes() const {
        const char *data;
        int64_t size;
        FORMPDF_CPP_CHECK(formpdf_buffer_get_data(*this, &data, &size));
        return std::string_view(data, size);
    }

    void write_to_file(const char *filename) const {
        FORMPDF_CPP_CHECK(formpdf_buffer_write_to_file(*this, filename));
    }

private:
    explicit Buffer(FormPDF_Buffer *buf) { _d.reset(buf); }
};

class FlattenOptions : public FormPDFC<FormPDF_FlattenOptions> {
public:
    friend Buffer flatten_form(std::string_view, const FlattenOptions &);

    FlattenOptions() {
        FormPDF_FlattenOptions *opts;
        FORMPDF_CPP_CHECK(formpdf_flatten_options_new(&opts));
        _d.reset(opts);
    }

    void set_default_font_size(double size) {
        FORMPDF_CPP_CHECK(formpdf_flatten_options_set_default_font_size(*this, size));
    }

    void set_compress_overlay(bool compress) {
        FORMPDF_CPP_CHECK(formpdf_flatten_options_set_compress_overlay(*this, compress));
    }
};

class ObjectStore : public FormPDFC<FormPDF_ObjectStore> {
public:
    ObjectStore() {
        FormPDF_ObjectStore *store;
        FORMPDF_CPP_CHECK(formpdf_object_store_new(&store));
        _d.reset(store);
    }

    int32_t reserve_id() {
        int32_t id;
        FORMPDF_CPP_CHECK(formpdf_object_store_reserve_id(*this, &id));
        return id;
    }

    int32_t add_object(const char *body, int32_t bodysize) {
        int32_t id;
        FORMPDF_CPP_CHECK(formpdf_object_store_add_object(*this, body, bodysize, &id));
        return id;
    }
    template<ByteSequence T> int32_t add_object(const T &body) {
        return add_object(body.data(), body.size());
    }

    void set_object(int32_t id, const char *body, int32_t bodysize) {
        FORMPDF_CPP_CHECK(formpdf_object_store_set_object(*this, id, body, bodysize));
    }
    template<ByteSequence T> void set_object(int32_t id, const T &body) {
        set_object(id, body.data(), body.size());
    }

    Buffer build_document(int32_t root_id, const DocumentProperties &props) const {
        FormPDF_Buffer *buf;
        FORMPDF_CPP_CHECK(formpdf_build_document(*this, root_id, props, &buf));
        return Buffer(buf);
    }
};

inline Buffer flatten_form(std::string_view pdf_data, const FlattenOptions &opts) {
    FormPDF_Buffer *buf;
    FORMPDF_CPP_CHECK(formpdf_flatten_form(pdf_data.data(), pdf_data.size(), opts, &buf));
    return Buffer(buf);
}

inline void verify_document(std::string_view pdf_data) {
    FORMPDF_CPP_CHECK(formpdf_verify_document(pdf_data.data(), pdf_data.size()));
}

} // namespace formpdf
