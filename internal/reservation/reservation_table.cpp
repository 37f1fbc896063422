#include "reservation_table.hpp"

#include "internal/util/saturating.hpp"
#include "internal/util/uuid.hpp"

namespace capacity::reservation {

namespace {

bool IsExpired(const Reservation& reservation, util::Timestamp now) {
  return reservation.expires_at_ms <= now;
}

} // namespace

ReservationTable::ReservationTable(std::shared_ptr<const util::TimeSource> clock, std::chrono::milliseconds ttl)
    : clock_(std::move(clock)), ttl_(ttl) {
}

void ReservationTable::PurgeExpired(util::Timestamp now) {
  for (auto it = reservations_.begin(); it != reservations_.end();) {
    if (IsExpired(it->second, now)) {
      it = reservations_.erase(it);
    } else {
      ++it;
    }
  }
}

Reservation ReservationTable::Insert(Reservation reservation) {
  const auto now = clock_->NowMillis();

  reservation.id            = util::ToString(util::GenerateUUID());
  reservation.expires_at_ms = util::SaturatingAdd(now, static_cast<uint64_t>(ttl_.count()));

  std::lock_guard lock(mutex_);
  PurgeExpired(now);
  reservations_[reservation.id] = reservation;
  return reservation;
}

std::optional<Reservation> ReservationTable::Take(const std::string& id) {
  const auto now = clock_->NowMillis();

  std::lock_guard lock(mutex_);
  PurgeExpired(now);

  auto it = reservations_.find(id);
  if (it == reservations_.end()) return std::nullopt;

  auto reservation = std::move(it->second);
  reservations_.erase(it);
  return reservation;
}

bool ReservationTable::Contains(const std::string& id) {
  const auto now = clock_->NowMillis();

  std::lock_guard lock(mutex_);
  PurgeExpired(now);
  return reservations_.contains(id);
}

std::size_t ReservationTable::Size() {
  const auto now = clock_->NowMillis();

  std::lock_guard lock(mutex_);
  PurgeExpired(now);
  return reservations_.size();
}

} // namespace capacity::reservation
