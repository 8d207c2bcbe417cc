#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <compare>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <numeric>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

template <typename T>
std::ostream &operator<<(std::ostream &stream, const std::vector<T> &vector)
{
    stream << "[";
    for (size_t i = 0; i < vector.size(); i++)
    {
        if (i != 0)
        {
            stream << ",";
        }
        stream << vector[i];
    }
    return stream << "]";
}
