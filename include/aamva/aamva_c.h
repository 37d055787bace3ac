#ifndef AAMVA_C_H
#define AAMVA_C_H

/**
 * AAMVA C API - Pure C interface for cross-language bindings
 *
 * This header provides a C-compatible API for use with:
 * - Point-of-sale hosts written in C or Objective-C
 * - Python ctypes/cffi
 * - Other FFI systems
 */

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Opaque handle types
 * ============================================================================ */

typedef struct aamva_parser_t aamva_parser_t;

/* ============================================================================
 * Enumerations
 * ============================================================================ */

typedef enum {
    AAMVA_ERROR_NONE = 0,
    AAMVA_ERROR_EMPTY_INPUT = 1,
    AAMVA_ERROR_INVALID_FORMAT = 2,
    AAMVA_ERROR_INVALID_FIELD = 3,
    AAMVA_ERROR_INTERNAL = 255
} aamva_error_t;

typedef enum {
    AAMVA_DOCUMENT_UNKNOWN = 0,
    AAMVA_DOCUMENT_DRIVER_LICENSE = 1,
    AAMVA_DOCUMENT_ID_CARD = 2
} aamva_document_t;

typedef enum {
    AAMVA_DOB_REQUIRE_VALID = 0,
    AAMVA_DOB_BEST_EFFORT = 1
} aamva_dob_policy_t;

/* ============================================================================
 * Data structures (C-compatible, fixed-size)
 * Absent fields are empty strings.
 * ============================================================================ */

#define AAMVA_MAX_NAME_LENGTH 64
#define AAMVA_MAX_ADDRESS_LENGTH 128
#define AAMVA_MAX_FIELD_LENGTH 32
#define AAMVA_DATE_LENGTH 11    /* "YYYY-MM-DD" + NUL */

typedef struct {
    /* Name */
    char last_name[AAMVA_MAX_NAME_LENGTH];
    char first_name[AAMVA_MAX_NAME_LENGTH];
    char middle_name[AAMVA_MAX_NAME_LENGTH];
    char full_name[AAMVA_MAX_ADDRESS_LENGTH];   /* DAA, "Last,First,Middle" */
    char date_of_birth[AAMVA_DATE_LENGTH];

    /* Address */
    char street_address[AAMVA_MAX_ADDRESS_LENGTH];
    char city[AAMVA_MAX_NAME_LENGTH];
    char state[AAMVA_MAX_FIELD_LENGTH];
    char zip_code[AAMVA_MAX_FIELD_LENGTH];

    /* Document */
    char license_number[AAMVA_MAX_FIELD_LENGTH];
    char issue_date[AAMVA_DATE_LENGTH];
    char expiration_date[AAMVA_DATE_LENGTH];

    /* Physical */
    char height[AAMVA_MAX_FIELD_LENGTH];
    char eye_color[AAMVA_MAX_FIELD_LENGTH];

    /* Header */
    char issuer_id[8];
    int aamva_version;
    aamva_document_t document_type;
} aamva_identity_t;

typedef struct {
    int success;
    aamva_error_t error;
    char error_message[128];
    aamva_identity_t identity;
} aamva_result_t;

typedef struct {
    aamva_dob_policy_t dob_policy;
    size_t header_search_window;
    size_t max_payload_size;
} aamva_config_t;

/* ============================================================================
 * Library functions
 * ============================================================================ */

/**
 * Get library version string
 */
const char* aamva_version(void);

/**
 * Get default configuration
 */
aamva_config_t aamva_default_config(void);

/**
 * Create a new parser instance with default configuration
 * @return Parser handle, or NULL on failure
 */
aamva_parser_t* aamva_create(void);

/**
 * Create a new parser instance with custom configuration
 * @param config Configuration options (NULL for defaults)
 * @return Parser handle, or NULL on failure
 */
aamva_parser_t* aamva_create_with_config(const aamva_config_t* config);

/**
 * Destroy a parser instance and free resources
 * @param parser Parser handle
 */
void aamva_destroy(aamva_parser_t* parser);

/**
 * Parse a raw barcode payload
 * @param parser Parser handle
 * @param data Payload bytes (need not be NUL-terminated)
 * @param data_len Length of data
 * @param result Output result structure
 * @return 0 if the call ran (check result->success), non-zero on bad arguments
 *         or internal error
 */
int aamva_parse(const aamva_parser_t* parser,
                const char* data,
                size_t data_len,
                aamva_result_t* result);

/**
 * Short description of an error code
 */
const char* aamva_error_string(aamva_error_t error);

#ifdef __cplusplus
}
#endif

#endif /* AAMVA_C_H */
