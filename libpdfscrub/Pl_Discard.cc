#include <pdfscrub/Pl_Discard.hh>

// Pl_Discard does not use the member pattern as there is no prospect of it ever requiring data
// members.

Pl_Discard::Pl_Discard() :
    Pipeline("discard", nullptr)
{
}

// Must be explicit and not inline -- see PDFSCRUB_DLL_CLASS in DLL.h
Pl_Discard::~Pl_Discard() = default;

void
Pl_Discard::write(unsigned char const*, size_t)
{
}

void
Pl_Discard::finish()
{
}
