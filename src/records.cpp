#include <algorithm>
#include <cstdint>
#include <vector>

#include "records.hpp"

std::vector<int64_t> tagIds(const std::vector<Tag>& tags)
{
    std::vector<int64_t> ids;
    ids.reserve(tags.size());
    for(const Tag& t : tags)
    {
        ids.push_back(t.id);
    }
    return ids;
}

std::vector<int64_t> uniqueIds(const std::vector<int64_t>& ids)
{
    std::vector<int64_t> result;
    result.reserve(ids.size());
    for(int64_t id : ids)
    {
        if(std::find(std::begin(result), std::end(result), id) ==
           std::end(result))
        {
            result.push_back(id);
        }
    }
    return result;
}
