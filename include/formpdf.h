// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2025 Jussi Pakkanen

#pragma once

#include <stdint.h>

#if defined _WIN32 || defined __CYGWIN__
#ifdef BUILDING_FORMPDF
#define FORMPDF_PUBLIC __declspec(dllexport)
#else
#define FORMPDF_PUBLIC __declspec(dllimport)
#endif
#else
#if defined __GNUC__
#define FORMPDF_PUBLIC __attribute__((visibility("default")))
#else
#define FORMPDF_PUBLIC
#endif
#endif

#ifdef __cplusplus
#define FORMPDF_NOEXCEPT noexcept
#else
#define FORMPDF_NOEXCEPT
#endif

#ifdef __cplusplus
extern "C" {
#endif

// Zero means success, anything else can be passed to formpdf_error_message.
typedef int32_t FormPDF_EC;

typedef enum {
    FORMPDF_PDF_1_3,
    FORMPDF_PDF_1_4,
    FORMPDF_PDF_1_5,
    FORMPDF_PDF_1_6,
    FORMPDF_PDF_1_7,
    FORMPDF_PDF_2_0,
} FormPDF_Pdf_Version;

typedef struct _FormPDF_DocumentProperties FormPDF_DocumentProperties;
typedef struct _FormPDF_FlattenOptions FormPDF_FlattenOptions;
typedef struct _FormPDF_ObjectStore FormPDF_ObjectStore;
typedef struct _FormPDF_Buffer FormPDF_Buffer;

FORMPDF_PUBLIC FormPDF_EC formpdf_document_properties_new(FormPDF_DocumentProperties **out_ptr)
    FORMPDF_NOEXCEPT;
FORMPDF_PUBLIC FormPDF_EC
formpdf_document_properties_destroy(FormPDF_DocumentProperties *docprops) FORMPDF_NOEXCEPT;
FORMPDF_PUBLIC FormPDF_EC formpdf_document_properties_set_version(
    FormPDF_DocumentProperties *docprops, FormPDF_Pdf_Version version) FORMPDF_NOEXCEPT;
FORMPDF_PUBLIC FormPDF_EC formpdf_document_properties_set_xref_stream(
    FormPDF_DocumentProperties *docprops, int32_t use_xref_stream) FORMPDF_NOEXCEPT;
FORMPDF_PUBLIC FormPDF_EC formpdf_document_properties_set_compress_streams(
    FormPDF_DocumentProperties *docprops, int32_t compress) FORMPDF_NOEXCEPT;

FORMPDF_PUBLIC FormPDF_EC formpdf_flatten_options_new(FormPDF_FlattenOptions **out_ptr)
    FORMPDF_NOEXCEPT;
FORMPDF_PUBLIC FormPDF_EC formpdf_flatten_options_destroy(FormPDF_FlattenOptions *opts)
    FORMPDF_NOEXCEPT;
FORMPDF_PUBLIC FormPDF_EC formpdf_flatten_options_set_default_font_size(
    FormPDF_FlattenOptions *opts, double size) FORMPDF_NOEXCEPT;
FORMPDF_PUBLIC FormPDF_EC formpdf_flatten_options_set_compress_overlay(
    FormPDF_FlattenOptions *opts, int32_t compress) FORMPDF_NOEXCEPT;

FORMPDF_PUBLIC FormPDF_EC formpdf_object_store_new(FormPDF_ObjectStore **out_ptr)
    FORMPDF_NOEXCEPT;
FORMPDF_PUBLIC FormPDF_EC formpdf_object_store_destroy(FormPDF_ObjectStore *store)
    FORMPDF_NOEXCEPT;
FORMPDF_PUBLIC FormPDF_EC formpdf_object_store_reserve_id(FormPDF_ObjectStore *store,
                                                          int32_t *out_id) FORMPDF_NOEXCEPT;
// Size -1 means the body is null terminated.
FORMPDF_PUBLIC FormPDF_EC formpdf_object_store_add_object(FormPDF_ObjectStore *store,
                                                          const char *body,
                                                          int32_t bodysize,
                                                          int32_t *out_id) FORMPDF_NOEXCEPT;
FORMPDF_PUBLIC FormPDF_EC formpdf_object_store_set_object(FormPDF_ObjectStore *store,
                                                          int32_t id,
                                                          const char *body,
                                                          int32_t bodysize) FORMPDF_NOEXCEPT;

FORMPDF_PUBLIC FormPDF_EC formpdf_build_document(const FormPDF_ObjectStore *store,
                                                 int32_t root_id,
                                                 const FormPDF_DocumentProperties *docprops,
                                                 FormPDF_Buffer **out_ptr) FORMPDF_NOEXCEPT;

// Returns the input unchanged in the buffer if there is nothing to flatten.
FORMPDF_PUBLIC FormPDF_EC formpdf_flatten_form(const char *pdf_data,
                                               int64_t pdf_size,
                                               const FormPDF_FlattenOptions *opts,
                                               FormPDF_Buffer **out_ptr) FORMPDF_NOEXCEPT;

FORMPDF_PUBLIC FormPDF_EC formpdf_verify_document(const char *pdf_data,
                                                  int64_t pdf_size) FORMPDF_NOEXCEPT;

FORMPDF_PUBLIC FormPDF_EC formpdf_buffer_get_data(const FormPDF_Buffer *buf,
                                                  const char **data,
                                                  int64_t *size) FORMPDF_NOEXCEPT;
FORMPDF_PUBLIC FormPDF_EC formpdf_buffer_write_to_file(const FormPDF_Buffer *buf,
                                                       const char *filename) FORMPDF_NOEXCEPT;
FORMPDF_PUBLIC FormPDF_EC formpdf_buffer_destroy(FormPDF_Buffer *buf) FORMPDF_NOEXCEPT;

FORMPDF_PUBLIC const char *formpdf_error_message(FormPDF_EC error_code) FORMPDF_NOEXCEPT;

#ifdef __cplusplus
}
#endif
