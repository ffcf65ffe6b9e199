/*
Licensed to the Apache Software Foundation (ASF) under one
or more contributor license agreements.  See the NOTICE file
distributed with this work for additional information
regarding copyright ownership.  The ASF licenses this file
to you under the Apache License, Version 2.0 (the
"License"); you may not use this file except in compliance
with the License.  You may obtain a copy of the License at

  http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing,
software distributed under the License is distributed on an
"AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
KIND, either express or implied.  See the License for the
specific language governing permissions and limitations
under the License.    
*/
#pragma once
#include <cmath>
#include <iostream>

namespace gcad {

// Small fixed size vector used for tool positions and arc centres.
template <typename T, int d> struct V {
    union{
        T _X[d];
        struct{
            T x,y,z;
        };
    };
    V() {
        for(int k = 0; k < d; k++) _X[k] = T();
    }
    explicit V(T x, T y) :x(x), y(y) {}
    explicit V(T x, T y, T z) :x(x), y(y), z(z) {}
    const T& operator[](int k) const{return _X[k];}
    T& operator[](int k) {return _X[k];}
    V<T,d> operator-(const V<T,d>& o) const {
        V<T,d> ret;
        for(int k=0;k<d;k++) ret[k] = (*this)[k] - o[k];
        return ret;
    }
    V<T,d> operator+(const V<T,d>& o) const {
        V<T,d> ret;
        for(int k=0;k<d;k++) ret[k] = (*this)[k] + o[k];
        return ret;
    }
    T dot(const V<T,d>& o) const {
        T sum = T();
        for(int k=0;k<d;k++) sum += (*this)[k] * o[k];
        return sum;
    }
    T length() const {
        return std::sqrt(dot(*this));
    }
    bool operator==(const V<T,d>& o) const {
        for(int k=0;k<d;k++) if((*this)[k] != o[k]) return false;
        return true;
    }
    bool operator!=(const V<T,d>& o) const {
        return !(*this == o);
    }
};
using V2d = V<double,2>;
using V3d = V<double,3>;

template<typename T,int d>
std::ostream& operator<<(std::ostream& o, const V<T,d>& v) {
    for(int k=0;k <d;k++) o<<v[k] << " ";
    return o;
}

} // namespace gcad
