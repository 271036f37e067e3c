#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

/**
 * Mean of the last `window` values added.  The values live in a ring buffer
 * and a running sum is kept, so add() and avg() are both constant time.
 */
template <typename T>
class RollingAverage
{
public:
  T avg() const;
  size_t size() const { return m_uiSize; }
  size_t count() const { return m_uiCount; }
  bool full() const { return m_uiSize == m_oValues.size(); }

  explicit RollingAverage(size_t window);
  void add(T value);
  void clear();

private:
  std::vector<T> m_oValues;

  T m_tSum;
  size_t m_uiNext;
  size_t m_uiSize;
  size_t m_uiCount; // values ever added, including those already evicted
};

template <typename T>
RollingAverage<T>::RollingAverage(size_t window)
: m_oValues(window)
{
  if (window == 0)
  {
    throw std::invalid_argument("RollingAverage: window must be positive");
  }
  clear();
}

template <typename T>
void RollingAverage<T>::add(T value)
{
  if (full())
  {
    m_tSum -= m_oValues[m_uiNext];
  }
  else
  {
    ++ m_uiSize;
  }
  m_oValues[m_uiNext] = value;
  m_tSum += value;
  m_uiNext = (m_uiNext + 1) % m_oValues.size();
  ++ m_uiCount;
}

template <typename T>
T RollingAverage<T>::avg() const
{
  if (!m_uiSize)
  {
    return T(0);
  }
  return m_tSum / T(m_uiSize);
}

template <typename T>
void RollingAverage<T>::clear()
{
  m_tSum = 0;
  m_uiNext = 0;
  m_uiSize = 0;
  m_uiCount = 0;
}
