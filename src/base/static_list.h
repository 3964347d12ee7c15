/*
 * base/static_list.h
 * -------------------------------------------------------------------------
 * Templated priority queue-style container that allows for load-time
 * initialization with the help of a static registration class.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2012, Tarick Bedeir.
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

#ifndef DXFER_BASE_STATIC_LIST_H
#define DXFER_BASE_STATIC_LIST_H

#include <map>

namespace dxfer {
namespace base {
template <class T>
class StaticList {
 private:
  using PriorityMap = std::multimap<int, T>;

 public:
  using const_iterator = typename PriorityMap::const_iterator;

  class Entry {
   public:
    inline Entry(const T &t, int priority) { Add(t, priority); }
  };

  inline static const_iterator begin() { return GetList()->begin(); }
  inline static const_iterator end() { return GetList()->end(); }

 private:
  inline static void Add(const T &t, int priority) {
    GetList()->insert(std::make_pair(priority, t));
  }

  // entries are added during static initialization, so the map has to be
  // created on first use rather than being a static member
  inline static PriorityMap *GetList() {
    static PriorityMap *list = new PriorityMap();
    return list;
  }
};
}  // namespace base
}  // namespace dxfer

#endif
