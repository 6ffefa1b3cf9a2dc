/**
 * @file vector_math.hpp
 * @brief 3D vector and position mathematics library
 *
 * This file provides the geometric primitives used by the physics and
 * particle code:
 * - Vector class for directions, velocities and extents
 * - Position class for point locations in world space
 * - Utility functions for common mathematical operations
 */

#ifndef REEFSIM_VECTOR_MATH_HPP
#define REEFSIM_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for floating point equality tests

/**
 * @brief Utility function for safe square root computation
 *
 * @param d Input value
 * @return double Square root of input, warns if input is negative
 */
double my_sqrt(double d);

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon=EPSILON);

/**
 * @brief Clamps a value into [lo, hi]
 */
double clampValue(double v, double lo, double hi);

/**
 * @brief Represents a 3D point in space
 *
 * Position class is used for absolute locations in world space.
 * Supports basic arithmetic and conversion to/from Vector.
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate (up)
    double z;  ///< Z coordinate

    /** @brief Constructs a Position at (0,0,0) */
    Position();

    /**
     * @brief Constructs a Position at specified coordinates
     */
    Position(double x, double y, double z);

    /** @brief Converts Position to Vector */
    operator Vector() const;

    Position operator+(const Position& b) const;
    Position operator-(const Position& b) const;
    Position operator*(double scalar) const;
    Position operator/(double scalar) const;

    /**
     * @brief Offsets this position by a displacement
     * @param v Displacement vector
     * @return New position moved by v
     */
    Position operator+(const Vector& v) const;

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;

    Position& operator+=(const Position& p);
    Position& operator-=(const Position& p);

    /**
     * @brief Moves this position by a displacement
     * @param v Displacement vector
     * @return Reference to this position
     */
    Position& operator+=(const Vector& v);

    /** @brief Exact component-wise equality */
    bool operator==(const Position& p) const;
    bool operator!=(const Position& p) const;
};

/**
 * @brief Represents a 3D vector with direction and magnitude
 *
 * Vector class provides the vector operations needed for
 * velocities, forces and box extents.
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component
    double z;  ///< Z component

    /** @brief Constructs a zero vector (0,0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     */
    Vector(double x, double y, double z);

    /**
     * @brief Constructs a vector from a position
     * @param p Position to convert
     */
    Vector(const Position& p);

    /** @brief Converts Vector to Position */
    operator Position() const;

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    /**
     * @brief Scales vector to specified length
     * @param length Target length
     * @return Vector with same direction but new length
     */
    Vector scale(double length) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude */
    double lengthSquared() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /**
     * @brief Calculates 3D cross product with another vector
     * @param other Other vector
     * @return Vector perpendicular to both operands
     */
    Vector cross(const Vector &other) const;

    /**
     * @brief Returns normalized vector (length = 1)
     *
     * A zero-length vector normalizes to the zero vector.
     */
    Vector normalized() const;

    /**
     * @brief Projects vector onto another vector
     * @param onto Vector to project onto
     * @return Projected vector
     */
    Vector projectOnto(const Vector &onto) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
    Vector& operator*=(double scalar);

    /** @brief Exact component-wise equality */
    bool operator==(const Vector& v) const;
    bool operator!=(const Vector& v) const;
};

/**
 * @brief Finds the point of an axis-aligned box closest to a point
 *
 * @param boxMin Minimum corner of the box
 * @param boxMax Maximum corner of the box
 * @param p Query point
 * @return Position Per-axis clamp of p into [boxMin, boxMax]
 */
Position closestPointOnBox(const Position &boxMin, const Position &boxMax, const Position &p);

#endif
