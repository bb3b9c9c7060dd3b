#include "sketchfl/data/batch_cursor.hh"

using namespace sketchfl::data;


BatchCursor::BatchCursor(const DataLoader &loader) : loader(&loader),
                                                     order(loader.Order()),
                                                     position(0),
                                                     state(State::Active) {}

boost::optional<Batch> BatchCursor::Next() {
    if (state == State::Exhausted)
        return boost::none;

    if (position >= loader->NumBatches()) {
        state = State::Exhausted;
        return boost::none;
    }

    return loader->MakeBatch(order, position++);
}

void BatchCursor::Reset() {
    order = loader->Order();
    position = 0;
    state = State::Active;
}

BatchCursor::State BatchCursor::GetState() const { return state; }

size_t BatchCursor::Position() const { return position; }
