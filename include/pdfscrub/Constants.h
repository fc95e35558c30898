/* Copyright (c) 2026 pdfscrub authors
 *
 * This file is part of pdfscrub.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef PDFSCRUB_CONSTANTS_H
#define PDFSCRUB_CONSTANTS_H

/*
 * Keep this file 'C' compatible. The numeric values of these
 * constants appear in reports and exit statuses, so new values are
 * added at the end of each enumeration and existing values are never
 * renumbered.
 */

/* Exit codes of ScrubJob and the pdfscrub CLI */

enum scrub_exit_code_e {
    scrub_exit_clean = 0,
    scrub_exit_error = 2, /* usage or I/O error */
    scrub_exit_rejected = 3,
    scrub_exit_unrecoverable = 4,
    scrub_exit_cancelled = 5,
};

/* Error codes carried by ScrubExc */

enum scrub_error_code_e {
    scrub_e_success = 0,
    scrub_e_internal,      /* logic/programming error -- indicates bug */
    scrub_e_system,        /* I/O error, memory error, etc. */
    scrub_e_unsupported,   /* PDF feature that pdfscrub does not handle */
    scrub_e_damaged_pdf,   /* recoverable damage localized to one object */
    scrub_e_unrecoverable, /* no usable trailer and no usable objects */
    scrub_e_detection,     /* a detector failed internally */
    scrub_e_clean_action,  /* a remedy could not be applied */
    scrub_e_verification,  /* findings survived cleaning */
    scrub_e_rebuild,       /* output serialization invariant violated */
    scrub_e_cancelled,     /* cancellation requested or deadline passed */
};

/* Object types */

enum scrub_object_type_e {
    ot_null = 0,
    ot_boolean,
    ot_integer,
    ot_real,
    ot_string,
    ot_name,
    ot_array,
    ot_dictionary,
    ot_reference,
};

/* Artifact kinds. Each kind is owned by exactly one detector. */

enum scrub_artifact_e {
    /* structural */
    ak_orphaned_object = 0,
    ak_duplicate_object_id,
    ak_revision_history,
    ak_dangling_reference,
    ak_malformed,
    ak_encrypted,
    /* metadata */
    ak_info_metadata,
    ak_xmp_metadata,
    ak_document_id,
    ak_private_app_data,
    /* signature */
    ak_digital_signature,
    ak_partial_signature_coverage,
    /* stream */
    ak_stream_length_mismatch,
    ak_anomalous_stream_size,
    ak_off_page_content,
    /* hidden data */
    ak_hidden_trailing_data,
    ak_steganographic_padding,
    ak_lsb_payload,
    ak_high_entropy_payload,
    ak_hidden_action,
    ak_hidden_optional_content,
    /* any detector */
    ak_detector_fault,
};

enum scrub_detector_e {
    sd_structural = 0,
    sd_metadata,
    sd_signature,
    sd_stream,
    sd_hidden_data,
};

enum scrub_severity_e {
    sev_low = 0,
    sev_medium,
    sev_high,
};

enum scrub_action_e {
    sa_redacted = 0,
    sa_removed,
    sa_rewritten,
    sa_ignored,
};

/* Terminal status of a run */

enum scrub_status_e {
    ss_clean = 0,
    ss_rejected,
    ss_cancelled,
    ss_unrecoverable,
};

enum scrub_xref_mode_e {
    scrub_xref_classic = 0,
    scrub_xref_stream,
};

enum pdf_annotation_flag_e {
    an_invisible = 1 << 0,
    an_hidden = 1 << 1,
    an_print = 1 << 2,
    an_no_zoom = 1 << 3,
    an_no_rotate = 1 << 4,
    an_no_view = 1 << 5,
};

#endif /* PDFSCRUB_CONSTANTS_H */
