// Copyright (c) 2026 pdfscrub authors
//
// This file is part of pdfscrub.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef SCRUBMATRIX_HH
#define SCRUBMATRIX_HH

#include <pdfscrub/DLL.h>

#include <string>

// A PDF transformation matrix [a b c d e f]. Points are transformed as the row vector [x y 1] times
// the matrix, as in the PDF specification.
class ScrubMatrix
{
  public:
    PDFSCRUB_DLL
    ScrubMatrix();
    PDFSCRUB_DLL
    ScrubMatrix(double a, double b, double c, double d, double e, double f);

    // Returns the six values separated by spaces as real numbers with trimmed zeroes.
    PDFSCRUB_DLL
    std::string unparse() const;

    // Replace this with other * this. This is what the cm operator does to the current
    // transformation matrix.
    PDFSCRUB_DLL
    void concat(ScrubMatrix const& other);

    // Same as concat(1, 0, 0, 1, tx, ty);
    PDFSCRUB_DLL
    void translate(double tx, double ty);

    PDFSCRUB_DLL
    void transform(double x, double y, double& xp, double& yp) const;

    // operator== tests for exact equality, not considering deltas for floating point.
    PDFSCRUB_DLL
    bool operator==(ScrubMatrix const& rhs) const;
    PDFSCRUB_DLL
    bool
    operator!=(ScrubMatrix const& rhs) const
    {
        return !operator==(rhs);
    }

    double a;
    double b;
    double c;
    double d;
    double e;
    double f;
};

#endif // SCRUBMATRIX_HH
