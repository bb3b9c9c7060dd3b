#ifndef SKETCHFL_DATA_BATCH_CURSOR_HH
#define SKETCHFL_DATA_BATCH_CURSOR_HH

#include <boost/optional.hpp>
#include "sketchfl/data/dataset.hh"

namespace sketchfl {

    namespace data {

        // A stateful walk over one pass of a DataLoader.
        // Next() yields batches until the pass is over, then reports exhaustion with boost::none;
        // Reset() starts a fresh pass from batch 0. The loader must outlive the cursor.
        class BatchCursor {

        public:
            enum class State {
                Active,
                Exhausted
            };

            explicit BatchCursor(const DataLoader &loader);

            boost::optional<Batch> Next();

            void Reset();

            State GetState() const;

            // Index of the batch the next call to Next() returns.
            size_t Position() const;

        private:
            const DataLoader *loader;
            arma::uvec order;                   // Visiting order of the current pass
            size_t position;
            State state;
        };

    } // end namespace data
} // end namespace sketchfl

#endif //SKETCHFL_DATA_BATCH_CURSOR_HH
