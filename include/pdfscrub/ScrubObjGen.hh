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


#ifndef SCRUBOBJGEN_HH
#define SCRUBOBJGEN_HH

#include <pdfscrub/DLL.h>

#include <compare>
#include <iostream>
#include <set>
#include <string>

// The object number and generation that key an indirect object. 0 0 never names an object and is
// used for "the trailer" wherever a location could be either.
class ScrubObjGen
{
  public:
    ScrubObjGen() = default;
    ScrubObjGen(int obj, int gen) :
        obj(obj),
        gen(gen)
    {
    }

    // Ordered by object number, then generation
    auto operator<=>(ScrubObjGen const&) const = default;

    int
    getObj() const
    {
        return obj;
    }
    int
    getGen() const
    {
        return gen;
    }
    bool
    isIndirect() const
    {
        return obj != 0;
    }
    std::string
    unparse(char separator = ' ') const
    {
        return std::to_string(obj) + separator + std::to_string(gen);
    }
    friend std::ostream&
    operator<<(std::ostream& os, ScrubObjGen og)
    {
        return os << og.unparse();
    }

    // Keys of indirect objects; direct ones (0 0) are never stored. add() returns false for a key
    // already present, which is how graph walks notice a loop.
    class PDFSCRUB_DLL_CLASS set: public std::set<ScrubObjGen>
    {
      public:
        bool
        add(ScrubObjGen og)
        {
            return !og.isIndirect() || emplace(og).second;
        }

        void
        erase(ScrubObjGen og)
        {
            if (og.isIndirect()) {
                std::set<ScrubObjGen>::erase(og);
            }
        }
    };

  private:
    int obj{0};
    int gen{0};
};

#endif // SCRUBOBJGEN_HH
