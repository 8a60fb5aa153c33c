// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2025 Jussi Pakkanen

#include <formpdf.h>
#include <docproperties.hpp>
#include <errorhandling.hpp>
#include <flattener.hpp>
#include <objectstore.hpp>
#include <pdfwriter.hpp>
#include <utils.hpp>
#include <verifier.hpp>

#include <fmt/core.h>

#include <cstring>
#include <exception>
#include <string>
#include <string_view>

#define RETNOERR return conv_err(ErrorCode::NoError)

#define CHECK_NULL(x)                                                                              \
    if(x == nullptr) {                                                                             \
        return conv_err(ErrorCode::ArgIsNull);                                                     \
    }

#define CHECK_BOOLEAN(b)                                                                           \
    if(b < 0 || b > 1) {                                                                           \
        return conv_err(ErrorCode::BadBoolean);                                                    \
    }

using namespace formpdf::internal;

struct PdfBuffer {
    std::string bytes;
};

namespace {

[[nodiscard]] FormPDF_EC conv_err(ErrorCode ec) { return (FormPDF_EC)ec; }

template<typename T> [[nodiscard]] FormPDF_EC conv_err(const rvoe<T> &rc) {
    return (FormPDF_EC)(rc ? ErrorCode::NoError : rc.error());
}

rvoe<std::string_view> validate_bytes(const char *buf, int64_t bufsize) {
    if(!buf) {
        RETERR(ArgIsNull);
    }
    if(bufsize < -1) {
        RETERR(InvalidBufsize);
    }
    if(bufsize == -1) {
        return std::string_view(buf, strlen(buf));
    }
    return std::string_view(buf, bufsize);
}

#if defined(__cpp_exceptions)
#define API_BOUNDARY_START try {
#define API_BOUNDARY_END                                                                           \
    }                                                                                              \
    catch(...) {                                                                                   \
        return handle_exception();                                                                 \
    }

#ifdef _MSC_VER
__declspec(noinline)
#else
__attribute__((noinline))
#endif
FormPDF_EC
handle_exception() {
    try {
        throw;
    } catch(ErrorCode ec) {
        return conv_err(ec);
    } catch(const std::exception &e) {
        fmt::print(stderr, "{}\n", e.what());
        return conv_err(ErrorCode::DynamicError);
    } catch(...) {
        fmt::print(stderr, "An error of an unknown type occurred.\n");
        return conv_err(ErrorCode::DynamicError);
    }
}

#else
#define API_BOUNDARY_START
#define API_BOUNDARY_END
#endif

} // namespace

FORMPDF_PUBLIC FormPDF_EC formpdf_document_properties_new(FormPDF_DocumentProperties **out_ptr)
    FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    CHECK_NULL(out_ptr);
    *out_ptr = reinterpret_cast<FormPDF_DocumentProperties *>(new DocumentProperties());
    RETNOERR;
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC
formpdf_document_properties_destroy(FormPDF_DocumentProperties *docprops) FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    delete reinterpret_cast<DocumentProperties *>(docprops);
    RETNOERR;
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_document_properties_set_version(
    FormPDF_DocumentProperties *docprops, FormPDF_Pdf_Version version) FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    CHECK_NULL(docprops);
    if(version < FORMPDF_PDF_1_3 || version > FORMPDF_PDF_2_0) {
        return conv_err(ErrorCode::BadEnum);
    }
    reinterpret_cast<DocumentProperties *>(docprops)->version = (PdfVersion)version;
    RETNOERR;
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_document_properties_set_xref_stream(
    FormPDF_DocumentProperties *docprops, int32_t use_xref_stream) FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    CHECK_NULL(docprops);
    CHECK_BOOLEAN(use_xref_stream);
    reinterpret_cast<DocumentProperties *>(docprops)->use_xref_stream = use_xref_stream;
    RETNOERR;
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_document_properties_set_compress_streams(
    FormPDF_DocumentProperties *docprops, int32_t compress) FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    CHECK_NULL(docprops);
    CHECK_BOOLEAN(compress);
    reinterpret_cast<DocumentProperties *>(docprops)->compress_streams = compress;
    RETNOERR;
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_flatten_options_new(FormPDF_FlattenOptions **out_ptr)
    FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    CHECK_NULL(out_ptr);
    *out_ptr = reinterpret_cast<FormPDF_FlattenOptions *>(new FlattenOptions());
    RETNOERR;
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_flatten_options_destroy(FormPDF_FlattenOptions *opts)
    FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    delete reinterpret_cast<FlattenOptions *>(opts);
    RETNOERR;
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_flatten_options_set_default_font_size(
    FormPDF_FlattenOptions *opts, double size) FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    CHECK_NULL(opts);
    if(!(size > 0)) {
        return conv_err(ErrorCode::InvalidFontSize);
    }
    reinterpret_cast<FlattenOptions *>(opts)->default_font_size = size;
    RETNOERR;
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_flatten_options_set_compress_overlay(
    FormPDF_FlattenOptions *opts, int32_t compress) FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    CHECK_NULL(opts);
    CHECK_BOOLEAN(compress);
    reinterpret_cast<FlattenOptions *>(opts)->compress_overlay = compress;
    RETNOERR;
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_object_store_new(FormPDF_ObjectStore **out_ptr)
    FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    CHECK_NULL(out_ptr);
    *out_ptr = reinterpret_cast<FormPDF_ObjectStore *>(new ObjectStore());
    RETNOERR;
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_object_store_destroy(FormPDF_ObjectStore *store)
    FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    delete reinterpret_cast<ObjectStore *>(store);
    RETNOERR;
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_object_store_reserve_id(FormPDF_ObjectStore *store,
                                                          int32_t *out_id) FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    CHECK_NULL(store);
    CHECK_NULL(out_id);
    *out_id = reinterpret_cast<ObjectStore *>(store)->reserve_id();
    RETNOERR;
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_object_store_add_object(FormPDF_ObjectStore *store,
                                                          const char *body,
                                                          int32_t bodysize,
                                                          int32_t *out_id) FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    CHECK_NULL(store);
    CHECK_NULL(out_id);
    auto rc = validate_bytes(body, bodysize);
    if(rc) {
        *out_id = reinterpret_cast<ObjectStore *>(store)->add(std::string(*rc));
    }
    return conv_err(rc);
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_object_store_set_object(FormPDF_ObjectStore *store,
                                                          int32_t id,
                                                          const char *body,
                                                          int32_t bodysize) FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    CHECK_NULL(store);
    auto rc = validate_bytes(body, bodysize);
    if(!rc) {
        return conv_err(rc);
    }
    return conv_err(reinterpret_cast<ObjectStore *>(store)->set(id, std::string(*rc)));
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_build_document(const FormPDF_ObjectStore *store,
                                                 int32_t root_id,
                                                 const FormPDF_DocumentProperties *docprops,
                                                 FormPDF_Buffer **out_ptr) FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    CHECK_NULL(store);
    CHECK_NULL(docprops);
    CHECK_NULL(out_ptr);
    auto rc = build_document(*reinterpret_cast<const ObjectStore *>(store),
                             root_id,
                             *reinterpret_cast<const DocumentProperties *>(docprops));
    if(rc) {
        *out_ptr = reinterpret_cast<FormPDF_Buffer *>(new PdfBuffer{std::move(rc.value())});
    }
    return conv_err(rc);
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_flatten_form(const char *pdf_data,
                                               int64_t pdf_size,
                                               const FormPDF_FlattenOptions *opts,
                                               FormPDF_Buffer **out_ptr) FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    CHECK_NULL(opts);
    CHECK_NULL(out_ptr);
    auto data = validate_bytes(pdf_data, pdf_size);
    if(!data) {
        return conv_err(data);
    }
    auto rc = flatten_form(*data, *reinterpret_cast<const FlattenOptions *>(opts));
    if(rc) {
        *out_ptr = reinterpret_cast<FormPDF_Buffer *>(new PdfBuffer{std::move(rc->bytes)});
    }
    return conv_err(rc);
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_verify_document(const char *pdf_data,
                                                  int64_t pdf_size) FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    auto data = validate_bytes(pdf_data, pdf_size);
    if(!data) {
        return conv_err(data);
    }
    return conv_err(verify_document(*data));
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_buffer_get_data(const FormPDF_Buffer *buf,
                                                  const char **data,
                                                  int64_t *size) FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    CHECK_NULL(buf);
    CHECK_NULL(data);
    CHECK_NULL(size);
    const auto *b = reinterpret_cast<const PdfBuffer *>(buf);
    *data = b->bytes.data();
    *size = (int64_t)b->bytes.size();
    RETNOERR;
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_buffer_write_to_file(const FormPDF_Buffer *buf,
                                                       const char *filename) FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    CHECK_NULL(buf);
    CHECK_NULL(filename);
    return conv_err(write_file(filename, reinterpret_cast<const PdfBuffer *>(buf)->bytes));
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC FormPDF_EC formpdf_buffer_destroy(FormPDF_Buffer *buf) FORMPDF_NOEXCEPT {
    API_BOUNDARY_START;
    delete reinterpret_cast<PdfBuffer *>(buf);
    RETNOERR;
    API_BOUNDARY_END;
}

FORMPDF_PUBLIC const char *formpdf_error_message(FormPDF_EC error_code) FORMPDF_NOEXCEPT {
    return error_text((ErrorCode)error_code);
}
