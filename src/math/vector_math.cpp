#include "reefsim/math/vector_math.hpp"

#include <algorithm>
#include <iostream>
#include <cmath>

double my_sqrt(double d) {
  if (d < 0) {
    std::cout << "-1 sqrt" << std::endl;
  }
  return std::sqrt(d);
}

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a-b) < epsilon;
}

double clampValue(double v, double lo, double hi) {
  return std::max(lo, std::min(v, hi));
}

// Position

Position::Position() : x(0), y(0), z(0) {}
Position::Position(double x, double y, double z) : x(x), y(y), z(z) {}

Position::operator Vector() const {
  return {this->x, this->y, this->z};
}

Position Position::operator+(const Position& b) const {
  return {this->x + b.x, this->y + b.y, this->z + b.z};
}

Position Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y, this->z - b.z};
}

Position Position::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar, this->z * scalar};
}

Position Position::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar, this->z / scalar};
}

Position Position::operator+(const Vector& v) const {
  return {this->x + v.x, this->y + v.y, this->z + v.z};
}

double Position::dist(const Position& p) const {
	double const dx = this->x - p.x;
	double const dy = this->y - p.y;
	double const dz = this->z - p.z;
	return my_sqrt(dx * dx + dy * dy + dz * dz);
}

Position& Position::operator+=(const Position& p) {
    this->x += p.x;
    this->y += p.y;
    this->z += p.z;
    return *this;
}

Position& Position::operator-=(const Position& p) {
    this->x -= p.x;
    this->y -= p.y;
    this->z -= p.z;
    return *this;
}

Position& Position::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    this->z += v.z;
    return *this;
}

bool Position::operator==(const Position& p) const {
  return this->x == p.x && this->y == p.y && this->z == p.z;
}

bool Position::operator!=(const Position& p) const {
  return !(*this == p);
}

// Vector

Vector::Vector() : x(0), y(0), z(0) {}
Vector::Vector(double x, double y, double z) : x(x), y(y), z(z) {}
Vector::Vector(const Position& p) : x(p.x), y(p.y), z(p.z) {}

Vector::operator Position() const {
  return {this->x, this->y, this->z};
}

Vector Vector::operator-() const {
    return {-this->x, -this->y, -this->z};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y, this->z + b.z};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y, this->z - b.z};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar, this->z * scalar};
}

Vector Vector::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar, this->z / scalar};
}

Vector Vector::scale(double length) const {
  return this->normalized() * length;
}

double Vector::length() const {
	return my_sqrt(this->lengthSquared());
}

double Vector::lengthSquared() const {
	return this->x * this->x + this->y * this->y + this->z * this->z;
}

double Vector::dotProduct(const Vector& v) const {
	return this->x * v.x + this->y * v.y + this->z * v.z;
}

Vector Vector::cross(const Vector &other) const {
  return {this->y * other.z - this->z * other.y,
          this->z * other.x - this->x * other.z,
          this->x * other.y - this->y * other.x};
}

Vector Vector::normalized() const {
  double const len = this->length();
  if (len > EPSILON) {
    return {this->x / len, this->y / len, this->z / len};
  }
  return {};
}

Vector Vector::projectOnto(const Vector &onto) const {
  double const lenSq = onto.lengthSquared();
  if (lenSq < EPSILON) {
    return {};
  }
  return onto * (this->dotProduct(onto) / lenSq);
}

Vector& Vector::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    this->z += v.z;
    return *this;
}

Vector& Vector::operator-=(const Vector& v) {
    this->x -= v.x;
    this->y -= v.y;
    this->z -= v.z;
    return *this;
}

Vector& Vector::operator*=(double scalar) {
    this->x *= scalar;
    this->y *= scalar;
    this->z *= scalar;
    return *this;
}

bool Vector::operator==(const Vector& v) const {
  return this->x == v.x && this->y == v.y && this->z == v.z;
}

bool Vector::operator!=(const Vector& v) const {
  return !(*this == v);
}

Position closestPointOnBox(const Position &boxMin, const Position &boxMax, const Position &p) {
  return {clampValue(p.x, boxMin.x, boxMax.x),
          clampValue(p.y, boxMin.y, boxMax.y),
          clampValue(p.z, boxMin.z, boxMax.z)};
}
