#pragma once

#include <string_view>

#include "listing.hpp"

// Class marker of the name column in the index table.
#define NAME_CELL_CLASS "fb-n"

// Extracts folders and files from a directory index page. Entries come from
// the anchors inside <td class="fb-n"> cells, in document order. A ".."
// folder pointing at the parent directory is always the first folder, and
// anchors whose href starts with ".." are left out so it is not repeated.
//
// Never throws. A page without the expected table gives just the "..".
Listing parse_listing(std::string_view base_url, std::string_view html);
