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

#ifndef PDFSCRUB_TYPES_H
#define PDFSCRUB_TYPES_H

/* Offsets into input files. Inputs are held in memory, but offsets
 * are still 64 bits so a file larger than 2 GiB reports correctly.
 */

typedef long long int scrub_offset_t;

#endif /* PDFSCRUB_TYPES_H */
